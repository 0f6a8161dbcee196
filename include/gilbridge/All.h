/***
 * Name: gilbridge (umbrella)
 * Purpose: Single include for the bridge's public surface.
 */
#pragma once

#include "gilbridge/BorrowedRef.h"
#include "gilbridge/Config.h"
#include "gilbridge/Conversion.h"
#include "gilbridge/DecodeError.h"
#include "gilbridge/Error.h"
#include "gilbridge/Fatal.h"
#include "gilbridge/GlobalLock.h"
#include "gilbridge/LockGuard.h"
#include "gilbridge/Owned.h"
#include "gilbridge/OwnedRef.h"
#include "gilbridge/Result.h"
#include "gilbridge/Token.h"
#include "gilbridge/exceptions/allocation_failure.h"
#include "gilbridge/exceptions/config_error.h"
#include "gilbridge/exceptions/invalid_reference.h"
#include "gilbridge/exceptions/scope_violation.h"
#include "gilbridge/types/Bytes.h"
#include "gilbridge/types/String.h"
