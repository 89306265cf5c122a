/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef LEDGER_CODEC_CARDANO_TX_BODY_HPP
#define LEDGER_CODEC_CARDANO_TX_BODY_HPP

#include <lc/cardano/cert.hpp>
#include <lc/cardano/governance.hpp>
#include <lc/cardano/tx-output.hpp>

namespace ledger_codec::cardano {
    using withdrawal_map = cddl::map_t<reward_account, coin>;
    using tx_input_set = cddl::set_t<tx_input>;
    using tx_output_list = cddl::vector_t<tx_output>;

    // Keys 0, 1 and 2 are required. The optional collections must not be empty when present.
    struct tx_body {
        tx_input_set inputs {};                                           // 0
        tx_output_list outputs {};                                        // 1
        coin fee = 0;                                                     // 2
        std::optional<slot> ttl {};                                       // 3
        std::optional<cert_list> certs {};                                // 4
        std::optional<withdrawal_map> withdrawals {};                     // 5
        std::optional<auxiliary_data_hash> aux_data_hash {};              // 7
        std::optional<slot> validity_start {};                            // 8
        std::optional<mint_t> mint {};                                    // 9
        std::optional<cardano::script_data_hash> script_data_hash {};     // 11
        std::optional<tx_input_set> collateral_inputs {};                 // 13
        std::optional<cddl::set_t<key_hash>> required_signers {};         // 14
        std::optional<uint8_t> network_id {};                             // 15
        std::optional<tx_output> collateral_return {};                    // 16
        std::optional<coin> total_collateral {};                          // 17
        std::optional<tx_input_set> reference_inputs {};                  // 18
        std::optional<voting_procedures_t> voting_procedures {};          // 19
        std::optional<proposal_procedure_list> proposal_procedures {};    // 20
        std::optional<coin> current_treasury {};                          // 21
        std::optional<positive_coin> donation {};                         // 22

        static tx_body from_cbor(const cbor::value &v);
        cbor::value to_cbor() const;

        bool operator==(const tx_body &o) const =default;
    };
}

#endif // !LEDGER_CODEC_CARDANO_TX_BODY_HPP
