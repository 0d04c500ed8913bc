// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "codec/compact.h"

#include <vector>

// ---------------------------------------------------------------------------
// Explicit instantiations of the compact codec for the byte-vector sink
// and the slice source, the combinations every length prefix goes
// through.  Other sinks and sources instantiate from the header.
// ---------------------------------------------------------------------------

namespace scale::codec {

// -------------------------------------------------------------------
// Encoding
// -------------------------------------------------------------------
template void encode_compact_to<uint8_t>(uint8_t, std::vector<uint8_t>&);
template void encode_compact_to<uint16_t>(uint16_t, std::vector<uint8_t>&);
template void encode_compact_to<uint32_t>(uint32_t, std::vector<uint8_t>&);
template void encode_compact_to<uint64_t>(uint64_t, std::vector<uint8_t>&);
template void encode_compact_to<uint128>(uint128, std::vector<uint8_t>&);

template void encode_length<std::vector<uint8_t>>(size_t, std::vector<uint8_t>&);

// -------------------------------------------------------------------
// Decoding
// -------------------------------------------------------------------
template core::Result<uint8_t>  decode_compact<uint8_t>(SliceInput&);
template core::Result<uint16_t> decode_compact<uint16_t>(SliceInput&);
template core::Result<uint32_t> decode_compact<uint32_t>(SliceInput&);
template core::Result<uint64_t> decode_compact<uint64_t>(SliceInput&);
template core::Result<uint128>  decode_compact<uint128>(SliceInput&);

template core::Result<void>     skip_compact<SliceInput>(SliceInput&);
template core::Result<uint32_t> decode_length<SliceInput>(SliceInput&);

}  // namespace scale::codec
