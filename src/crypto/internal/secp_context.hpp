#pragma once

extern "C" {
#include <secp256k1.h>
}

namespace cktap::internal {

// Process-wide context, created on first use and only read afterwards.
const secp256k1_context* GetSecpContext();

}  // namespace cktap::internal
