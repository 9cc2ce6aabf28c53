#ifndef ONYXNET_ERRORS_HPP
#define ONYXNET_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace OnyxNet {

/**
 * @brief Base class for all OnyxNet exceptions.
 */
class Exception : public std::exception {
public:
    explicit Exception(const std::string& message) : msg_(message) {}
    explicit Exception(const char* message) : msg_(message) {}
    virtual ~Exception() noexcept override = default;

    virtual const char* what() const noexcept override {
        return msg_.c_str();
    }

protected:
    std::string msg_;
};

/**
 * @brief Exception for errors that occur at runtime.
 */
class RuntimeError : public Exception {
public:
    explicit RuntimeError(const std::string& message) : Exception(message) {}
    explicit RuntimeError(const char* message) : Exception(message) {}
};

/**
 * @brief Exception for logic errors in the library's usage.
 */
class LogicError : public Exception {
public:
    explicit LogicError(const std::string& message) : Exception(message) {}
    explicit LogicError(const char* message) : Exception(message) {}
};

/**
 * @brief Exception for invalid arguments.
 */
class InvalidArgument : public LogicError {
public:
    explicit InvalidArgument(const std::string& message) : LogicError(message) {}
    explicit InvalidArgument(const char* message) : LogicError(message) {}
};

/**
 * @brief The RSA key pair could not be generated. Fatal for the session.
 */
class KeyGenerationError : public RuntimeError {
public:
    explicit KeyGenerationError(const std::string& message) : RuntimeError(message) {}
};

/**
 * @brief A peer's PEM could not be parsed as an SPKI RSA public key.
 */
class KeyImportError : public RuntimeError {
public:
    explicit KeyImportError(const std::string& message) : RuntimeError(message) {}
};

/**
 * @brief The cipher or key-wrap provider failed while sealing a message.
 */
class CryptoError : public RuntimeError {
public:
    explicit CryptoError(const std::string& message) : RuntimeError(message) {}
};

/**
 * @brief Base for every reason an inbound envelope cannot be opened.
 */
class DecryptError : public RuntimeError {
public:
    explicit DecryptError(const std::string& message) : RuntimeError(message) {}
};

// The envelope carries no wrapped key for our id. Expected when overhearing.
class NoKeyForRecipient : public DecryptError {
public:
    explicit NoKeyForRecipient(const std::string& message) : DecryptError(message) {}
};

class KeyUnwrapError : public DecryptError {
public:
    explicit KeyUnwrapError(const std::string& message) : DecryptError(message) {}
};

// Tag mismatch or corrupted ciphertext.
class AuthenticationError : public DecryptError {
public:
    explicit AuthenticationError(const std::string& message) : DecryptError(message) {}
};

/**
 * @brief The transport is not open; the frame was not sent.
 */
class DisconnectedError : public RuntimeError {
public:
    explicit DisconnectedError(const std::string& message) : RuntimeError(message) {}
};

} // namespace OnyxNet

#endif // ONYXNET_ERRORS_HPP
