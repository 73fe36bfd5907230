//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Validators.h
// Purpose: Lightweight validation of tool arguments against a JSON Schema subset
//==========================================================================================================

#pragma once

#include <string>
#include <vector>
#include "toolgate/JSONRPCTypes.h"

namespace toolgate {
namespace validation {

//------------------------------ Field errors ------------------------------
struct FieldError {
    std::string field;   // dotted path, array items as [i]; empty for the arguments object itself
    std::string reason;
};

//==========================================================================================================
// validateArguments
// Purpose: Checks tool arguments against the tool's inputSchema.
// Supported keywords:
//   type (string or array of strings), properties, required, additionalProperties (false only),
//   enum, items. Unknown keywords are ignored; a non-object schema accepts anything.
// Returns:
//   All mismatches found, in document order. Empty when the arguments are valid.
//==========================================================================================================
std::vector<FieldError> validateArguments(const JSONValue& schema, const JSONValue& arguments);

// JSON Schema type name of a value ("integer" for int64, "number" for double).
std::string jsonTypeName(const JSONValue& v);

// Serialize field errors as {"fields":[...],"errors":[{"field":..,"reason":..}]}.
JSONValue fieldErrorsToJSON(const std::vector<FieldError>& errors);

} // namespace validation
} // namespace toolgate
