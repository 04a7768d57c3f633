#pragma once
#include <consign/schema/encoding/scale/acknowledge_transfer.hpp>
#include <consign/schema/encoding/scale/approve_transfer.hpp>
#include <consign/schema/encoding/scale/create_asset.hpp>
#include <consign/schema/encoding/scale/offer_transfer.hpp>
#include <consign/schema/encoding/scale/reject_transfer.hpp>
#include <consign/schema/primitives.hpp>
#include <consign/schema/transition_payload.hpp>

#include <optional>

namespace consign::schema::encoding::scale {

// Wire layout: one byte holding the action (the variant index) followed by
// the fields of that action's payload.
void encode(const consign::schema::transition_payload_t& payload,
            consign::schema::bytes_t& out);

std::optional<consign::schema::transition_payload_t> try_decode(
    const consign::schema::bytes_view_t& bytes);

}  // namespace consign::schema::encoding::scale
