#pragma once
#include <cstdint>
#include <exception>
#include <stdexcept>
#include <string>

namespace tftpwire {

// Values are the wire error codes.
enum class ErrorKind : uint16_t {
    NotDefined = 0,
    FileNotFound = 1,
    AccessViolation = 2,
    DiskFull = 3,
    IllegalOperation = 4,
    UnknownTransferID = 5,
    FileExists = 6,
    NoSuchUser = 7
};

struct Error {
    ErrorKind kind{ErrorKind::NotDefined};
    // file name, transfer id, user name or free-form text depending on kind
    std::string detail;

    std::string message() const;
    uint16_t code() const { return static_cast<uint16_t>(kind); }
};

Error file_not_found(const std::string& file);
Error access_violation();
Error disk_full();
Error illegal_operation(const std::string& message);
Error unknown_transfer_id(const std::string& tid);
Error file_exists(const std::string& file);
Error no_such_user(const std::string& user);
Error not_defined(const std::string& message);

const char* kind_name(ErrorKind kind);
ErrorKind kind_from_code(uint16_t code);

class CodecError : public std::runtime_error {
public:
    explicit CodecError(const Error& err)
        : std::runtime_error(err.message()), err_(err) {}
    const Error& error() const noexcept { return err_; }
private:
    Error err_;
};

struct ErrorPacket;

ErrorPacket to_error_packet(const Error& err);
ErrorPacket to_error_packet(const CodecError& e);
// Rethrows `e` so a CodecError keeps its kind however it was caught. Any
// other exception maps to code 0 with its what() text.
ErrorPacket to_error_packet(std::exception_ptr e);

} // namespace tftpwire
