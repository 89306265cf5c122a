/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef LEDGER_CODEC_CARDANO_HASH_HPP
#define LEDGER_CODEC_CARDANO_HASH_HPP

#include <lc/cardano/cost-models.hpp>
#include <lc/cardano/metadata.hpp>
#include <lc/cardano/redeemer.hpp>
#include <lc/cardano/tx-body.hpp>

namespace ledger_codec::cardano {
    using datum_list = vector<plutus_data>;

    extern result<tx_hash> hash_transaction_body(const tx_body &body);
    // The auxiliary data is hashed in its recorded era form.
    extern result<auxiliary_data_hash> hash_auxiliary_data(const auxiliary_data &aux);
    extern result<datum_hash> hash_plutus_data(const plutus_data &datum);

    // redeemers || datums || language views, except for A0 || datums || A0 when there are datums but no redeemers.
    // An empty datum list is the same as an absent one.
    extern result<uint8_vector> script_data_payload(const redeemers_t &redeemers, const cost_models &models, const std::optional<datum_list> &datums={});
    extern result<script_data_hash> hash_script_data(const redeemers_t &redeemers, const cost_models &models, const std::optional<datum_list> &datums={});
}

#endif // !LEDGER_CODEC_CARDANO_HASH_HPP
