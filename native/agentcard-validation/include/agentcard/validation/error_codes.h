// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#pragma once

/**
 * @file error_codes.h
 * @brief Stable error codes reported in ValidationFailure::error_code.
 */

#include <string_view>

namespace agentcard::validation::error_codes {

// Protected header could not be decoded.
inline constexpr std::string_view kMalformedHeader = "MALFORMED_HEADER";
// Signature entry or signature value is unusable.
inline constexpr std::string_view kMalformedSignature = "MALFORMED_SIGNATURE";
// Protected header lists a critical extension this verifier does not implement.
inline constexpr std::string_view kUnsupportedCriticalHeader = "UNSUPPORTED_CRIT";

// Algorithm policy.
inline constexpr std::string_view kMissingAlgorithm = "MISSING_ALG";
inline constexpr std::string_view kDisallowedAlgorithm = "DISALLOWED_ALG";
inline constexpr std::string_view kUnsupportedAlgorithm = "UNSUPPORTED_ALG";
inline constexpr std::string_view kAlgorithmMismatch = "ALG_MISMATCH";
inline constexpr std::string_view kInsecureKeyUri = "INSECURE_KEY_URI";
inline constexpr std::string_view kInvalidKeyUri = "INVALID_KEY_URI";

// Key resolution.
inline constexpr std::string_view kMissingKeyUri = "MISSING_KEY_URI";
inline constexpr std::string_view kKeyFetchTimeout = "KEY_FETCH_TIMEOUT";
inline constexpr std::string_view kKeyFetchError = "KEY_FETCH_ERROR";
inline constexpr std::string_view kKeyNotFound = "KEY_NOT_FOUND";
inline constexpr std::string_view kInvalidPublicKey = "INVALID_PUBLIC_KEY";

// Cryptographic check.
inline constexpr std::string_view kSignatureInvalid = "SIGNATURE_INVALID";

// Unexpected fault converted at the per-signature boundary.
inline constexpr std::string_view kInternalError = "INTERNAL_ERROR";

} // namespace agentcard::validation::error_codes
