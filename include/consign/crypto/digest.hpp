#pragma once

#include <consign/schema/primitives.hpp>

#include <string>
#include <string_view>

namespace consign::crypto {

/// SHA-512 of the input bytes.
consign::schema::hash64_t sha512(const consign::schema::bytes_view_t& bytes);
consign::schema::hash64_t sha512(const std::string_view& str);

/// Lowercase hex SHA-512 of `str`, truncated to `length` characters
/// (at most 128).
std::string sha512_hex(const std::string_view& str, std::size_t length = 128);

}  // namespace consign::crypto
