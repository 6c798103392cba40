#ifndef PAGESTORE_CODEC_ERROR_HPP
#define PAGESTORE_CODEC_ERROR_HPP

#include <stdexcept>
#include <string>

namespace pagestore::codec {

class CodecError : public std::runtime_error {
public:
    explicit CodecError(const std::string& message) 
        : std::runtime_error(message) {}
};

class EncodeError : public CodecError {
public:
    explicit EncodeError(const std::string& message) 
        : CodecError("Encode error: " + message) {}
};

class DecodeError : public CodecError {
public:
    explicit DecodeError(const std::string& message) 
        : CodecError("Decode error: " + message) {}
};

} // namespace pagestore::codec

#endif // PAGESTORE_CODEC_ERROR_HPP
