/***
 * Name: stackbridge::exceptions::InvalidEncodingError::InvalidEncodingError
 * Purpose: Build the message "invalid text at byte offset N".
 */
#include "stackbridge/exceptions/invalid_encoding_error.h"

#include <string>

namespace stackbridge::exceptions {

InvalidEncodingError::InvalidEncodingError(std::size_t offset)
    : MarshalError(ErrorKind::InvalidEncoding, "invalid text at byte offset " + std::to_string(offset)),
      offset_(offset) {}

}  // namespace stackbridge::exceptions
