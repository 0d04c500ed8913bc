#pragma once
// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// Convenience header pulling in the whole codec.

#include "codec/bit_vec.h"
#include "codec/codec.h"
#include "codec/compact.h"
#include "codec/containers.h"
#include "codec/decode_length.h"
#include "codec/encode_append.h"
#include "codec/int128.h"
#include "codec/io.h"
#include "codec/options.h"
#include "codec/primitives.h"
#include "codec/type_info.h"
#include "codec/variant_index.h"
#include "codec/wrappers.h"
