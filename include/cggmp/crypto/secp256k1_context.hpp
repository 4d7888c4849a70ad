#pragma once

extern "C" {
#include <secp256k1.h>
}

namespace cggmp {

// Process-wide context shared by point arithmetic and signature verification.
secp256k1_context* Secp256k1Context();

}  // namespace cggmp
