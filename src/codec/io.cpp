// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "codec/io.h"

// ---------------------------------------------------------------------------
// Explicit instantiations of the input adapters over the slice source,
// which is what decode_with_depth_limit() and the tests wrap.
// ---------------------------------------------------------------------------

namespace scale::codec {

template class DepthLimitInput<SliceInput>;
template class CountedInput<SliceInput>;
template class CountedInput<DepthLimitInput<SliceInput>>;

template core::Result<uint8_t> read_byte<SliceInput>(SliceInput&);
template core::Result<void>    skip_bytes<SliceInput>(SliceInput&, size_t);
template core::Result<void>    descend_ref<SliceInput>(SliceInput&);
template void                  ascend_ref<SliceInput>(SliceInput&);

}  // namespace scale::codec
