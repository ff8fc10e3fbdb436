// ============================================================================
// Farewell - Main Include Header
// ============================================================================
// Include this single header to access all Farewell claimer functionality.
// ============================================================================

#ifndef FAREWELL_FAREWELL_HPP
#define FAREWELL_FAREWELL_HPP

// Core types and utilities
#include "farewell/types.hpp"
#include "farewell/version.hpp"
#include "farewell/encoding.hpp"
#include "farewell/file_io.hpp"
#include "farewell/json.hpp"

// Payload cryptography (AES-128-GCM, XOR key shares)
#include "farewell/key_reconstructor.hpp"
#include "farewell/payload_encryptor.hpp"
#include "farewell/payload_decryptor.hpp"

// Claim packages
#include "farewell/message.hpp"
#include "farewell/claim_parser.hpp"

// Delivery proofs
#include "farewell/recipient_commitment.hpp"
#include "farewell/delivery_proof.hpp"
#include "farewell/proof_assembler.hpp"
#include "farewell/proof_validator.hpp"

#endif // FAREWELL_FAREWELL_HPP
