#include "errors.hpp"
#include "protocol.hpp"

namespace tftpwire {

std::string Error::message() const {
  switch (kind) {
  case ErrorKind::FileNotFound:
    return "Error File Not Found - " + detail;
  case ErrorKind::AccessViolation:
    return "Error Access Violation";
  case ErrorKind::DiskFull:
    return "Error Disk Full";
  case ErrorKind::IllegalOperation:
    return "Error Illegal Operation -  " + detail;
  case ErrorKind::UnknownTransferID:
    return "Error Unknown Transfer ID - " + detail;
  case ErrorKind::FileExists:
    return "Error File Exists: " + detail;
  case ErrorKind::NoSuchUser:
    return "Error No Such User: " + detail;
  case ErrorKind::NotDefined:
    break;
  }
  return detail;
}

Error file_not_found(const std::string &file) {
  return Error{ErrorKind::FileNotFound, file};
}

Error access_violation() { return Error{ErrorKind::AccessViolation, {}}; }

Error disk_full() { return Error{ErrorKind::DiskFull, {}}; }

Error illegal_operation(const std::string &message) {
  return Error{ErrorKind::IllegalOperation, message};
}

Error unknown_transfer_id(const std::string &tid) {
  return Error{ErrorKind::UnknownTransferID, tid};
}

Error file_exists(const std::string &file) {
  return Error{ErrorKind::FileExists, file};
}

Error no_such_user(const std::string &user) {
  return Error{ErrorKind::NoSuchUser, user};
}

Error not_defined(const std::string &message) {
  return Error{ErrorKind::NotDefined, message};
}

const char *kind_name(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::NotDefined:
    return "NotDefined";
  case ErrorKind::FileNotFound:
    return "FileNotFound";
  case ErrorKind::AccessViolation:
    return "AccessViolation";
  case ErrorKind::DiskFull:
    return "DiskFull";
  case ErrorKind::IllegalOperation:
    return "IllegalOperation";
  case ErrorKind::UnknownTransferID:
    return "UnknownTransferID";
  case ErrorKind::FileExists:
    return "FileExists";
  case ErrorKind::NoSuchUser:
    return "NoSuchUser";
  }
  return "NotDefined";
}

ErrorKind kind_from_code(uint16_t code) {
  if (code >= 1 && code <= kMaxErrorCode)
    return static_cast<ErrorKind>(code);
  return ErrorKind::NotDefined;
}

ErrorPacket to_error_packet(const Error &err) {
  ErrorPacket p;
  p.code = err.code();
  p.message = err.message();
  return p;
}

ErrorPacket to_error_packet(const CodecError &e) {
  return to_error_packet(e.error());
}

ErrorPacket to_error_packet(std::exception_ptr e) {
  if (!e)
    return to_error_packet(not_defined("no error"));
  try {
    std::rethrow_exception(e);
  } catch (const CodecError &ce) {
    return to_error_packet(ce);
  } catch (const std::exception &other) {
    return to_error_packet(not_defined(other.what()));
  } catch (...) {
    return to_error_packet(not_defined("unknown error"));
  }
}

} // namespace tftpwire
