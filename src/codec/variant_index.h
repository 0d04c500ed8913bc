#pragma once
// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>

namespace scale::codec {

// ===================================================================
// Variant discriminants for generated enum codecs
// ===================================================================
//
// Every encoded enum value starts with one discriminant byte.  For
// each variant, in declaration order, it is
//
//   1. the explicit index override, if the variant has one,
//   2. else the variant's own discriminant value, if it declares one,
//   3. else its ordinal among the non-skipped variants, from 0.
//
// Skipped variants are never written and have no discriminant.
// Nothing stops two variants from landing on the same byte:
//
//   enum T { A = 1, B };   // A -> 1 (discriminant), B -> 1 (ordinal)
//
// Such collisions are kept as computed.  A decoder matching on the
// byte picks the first variant declaring it.
// ===================================================================

/// Everything the discriminant of one variant depends on.
struct VariantDecl {
    std::optional<uint8_t> index;         ///< explicit override
    std::optional<int64_t> discriminant;  ///< declared enumerator value
    bool                   skip = false;
};

/// Discriminant of a single variant given its ordinal among the
/// non-skipped variants before it.
constexpr std::optional<uint8_t> variant_index(const VariantDecl& v, size_t ordinal) {
    if (v.skip) return std::nullopt;
    if (v.index) return *v.index;
    if (v.discriminant) {
        if (*v.discriminant < 0 || *v.discriminant > 0xFF) {
            throw std::out_of_range("enum discriminant does not fit in one byte");
        }
        return static_cast<uint8_t>(*v.discriminant);
    }
    if (ordinal > 0xFF) {
        throw std::out_of_range("enum has more than 256 encodable variants");
    }
    return static_cast<uint8_t>(ordinal);
}

/// Discriminants of all variants in declaration order; std::nullopt for
/// skipped ones.  Usable in constant expressions.
template <size_t N>
constexpr std::array<std::optional<uint8_t>, N>
assign_variant_indices(const std::array<VariantDecl, N>& variants) {
    static_assert(N <= 256, "an enum has at most 256 variants");
    std::array<std::optional<uint8_t>, N> out{};
    size_t ordinal = 0;
    for (size_t i = 0; i < N; ++i) {
        out[i] = variant_index(variants[i], ordinal);
        if (!variants[i].skip) ++ordinal;
    }
    return out;
}

/// Position of the first variant whose discriminant is @p byte.
template <size_t N>
constexpr std::optional<size_t>
find_variant(const std::array<std::optional<uint8_t>, N>& indices, uint8_t byte) {
    for (size_t i = 0; i < N; ++i) {
        if (indices[i] && *indices[i] == byte) return i;
    }
    return std::nullopt;
}

}  // namespace scale::codec
