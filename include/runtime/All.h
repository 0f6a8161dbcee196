/***
 * Name: gilbridge::rt umbrella header
 * Purpose: Aggregate the bundled runtime's public headers.
 */
#pragma once

#include "runtime/TypeTag.h"
#include "runtime/RuntimeStats.h"
#include "runtime/Runtime.h"
#include "runtime/RuntimeApi.h"
