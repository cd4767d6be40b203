#ifndef BGCODE_ERRORS_HPP
#define BGCODE_ERRORS_HPP

#include <cstdint>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <sstream>

// Every decode failure is terminal for the call that raised it.
class BgcodeError : public std::runtime_error {
public:
    explicit BgcodeError(const std::string& what) : std::runtime_error(what) {}
};

// Buffer shorter than the file header, wrong magic, or an unsupported
// version / checksum type.
class MalformedHeader : public BgcodeError {
public:
    explicit MalformedHeader(const std::string& what) : BgcodeError(what) {}
};

// A declared size runs past the end of the buffer.
class TruncatedBlock : public BgcodeError {
public:
    TruncatedBlock(size_t offset, const std::string& what)
        : BgcodeError(what), offset(offset) {}

    size_t offset;
};

class ChecksumMismatch : public BgcodeError {
public:
    ChecksumMismatch(uint16_t block_type, size_t offset, uint32_t expected, uint32_t computed)
        : BgcodeError(format(block_type, offset, expected, computed)),
          block_type(block_type), offset(offset), expected(expected), computed(computed) {}

    uint16_t block_type;
    size_t offset;
    uint32_t expected;
    uint32_t computed;

private:
    static std::string format(uint16_t block_type, size_t offset, uint32_t expected, uint32_t computed) {
        std::ostringstream oss;
        oss << "CRC32 mismatch in block type " << block_type << " at offset " << offset
            << ": stored 0x" << std::hex << expected << ", computed 0x" << computed;
        return oss.str();
    }
};

// A params encoding (or compression scheme, see below) the codec does not
// decode, e.g. MeatPack.
class UnsupportedEncoding : public BgcodeError {
public:
    UnsupportedEncoding(uint16_t value, size_t offset, const std::string& what)
        : BgcodeError(what), value(value), offset(offset) {}

    uint16_t value;
    size_t offset;
};

// Heatshrink and any unknown compression value.
class UnsupportedCompression : public UnsupportedEncoding {
public:
    UnsupportedCompression(uint16_t value, size_t offset)
        : UnsupportedEncoding(value, offset,
              "Unsupported block compression " + std::to_string(value) +
              " at offset " + std::to_string(offset)) {}
};

class NoPayloadBlocksFound : public BgcodeError {
public:
    NoPayloadBlocksFound() : BgcodeError("No GCode blocks found in bgcode data") {}
};

class DecompressionFailed : public BgcodeError {
public:
    DecompressionFailed(size_t offset, const std::string& reason)
        : BgcodeError("DEFLATE decompression failed at offset " + std::to_string(offset) + ": " + reason),
          offset(offset) {}

    size_t offset;
};

#endif // BGCODE_ERRORS_HPP
