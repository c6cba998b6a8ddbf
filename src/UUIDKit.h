#pragma once

#define UUIDKIT_LIB_VERSION "1.0.0"

#include "UUID128.h"
#include "UUIDGen.h"
#include "UUID4Sequence.h"
#include "UUID7Clock.h"
