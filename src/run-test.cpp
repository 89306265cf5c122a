/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <iostream>
#include <lc/common/logger.hpp>
#include <lc/common/test.hpp>

int main(const int argc, const char **argv)
{
    using namespace ledger_codec;
    logger::configure({ .path = "run-test.log", .min_level = logger::level::trace });
    if (argc >= 2) {
        std::cerr << "using test-filter mask: " << argv[1] << '\n';
        boost::ut::cfg<boost::ut::override> = { .filter = argv[1] };
    }
    bool failed = true;
    const auto ex = logger::run_log_errors([&] {
        failed = boost::ut::cfg<boost::ut::override>.run();
    });
    failed = failed || ex;
    logger::info("run-test finished with {}", failed ? "failures" : "success");
    return failed ? 1 : 0;
}
