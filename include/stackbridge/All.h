/***
 * Name: stackbridge (umbrella header)
 * Purpose: Everything a host needs: buffers, the stack handle, the marshalling
 *          protocol with every built-in Marshal<T>, the error bridge and make_function.
 */
#pragma once

#include "stackbridge/buffer/NonOwning.h"
#include "stackbridge/buffer/OwnedBuffer.h"
#include "stackbridge/config/Config.h"
#include "stackbridge/exceptions/config_error.h"
#include "stackbridge/exceptions/decode_error.h"
#include "stackbridge/exceptions/encode_error.h"
#include "stackbridge/exceptions/into_text_error.h"
#include "stackbridge/exceptions/invalid_encoding_error.h"
#include "stackbridge/exceptions/raised_error.h"
#include "stackbridge/exceptions/runtime_error.h"
#include "stackbridge/exceptions/stack_overflow_error.h"
#include "stackbridge/exceptions/type_mismatch_error.h"
#include "stackbridge/marshal/Containers.h"
#include "stackbridge/marshal/ErrorBridge.h"
#include "stackbridge/marshal/Invoke.h"
#include "stackbridge/marshal/Marshal.h"
#include "stackbridge/marshal/Primitives.h"
#include "stackbridge/vm/State.h"
