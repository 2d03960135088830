#pragma once

#include <stdexcept>
#include <string>

namespace swiftstore {

// Base class for every error raised by the storage layer
class StorageError : public std::runtime_error {
public:
    explicit StorageError(const std::string& message)
        : std::runtime_error(message) {}
};

// The request never produced an HTTP status (DNS, connect, TLS, timeout...)
class TransportError : public StorageError {
public:
    explicit TransportError(const std::string& message)
        : StorageError("Transport error: " + message) {}
};

// A status the operation does not map. Deliberately unclassified.
class UnexpectedStatusError : public StorageError {
public:
    explicit UnexpectedStatusError(int status)
        : StorageError("Unexpected status code: " + std::to_string(status))
        , status_(status) {}

    int status() const { return status_; }

private:
    int status_;
};

// Body declared as JSON that does not parse, or a body of the wrong type
class MalformedResponseError : public StorageError {
public:
    MalformedResponseError(const std::string& message, std::string body)
        : StorageError(message)
        , body_(std::move(body)) {}

    const std::string& body() const { return body_; }

private:
    std::string body_;
};

class ContainerError : public StorageError {
public:
    ContainerError(const std::string& message, std::string container_name)
        : StorageError(message)
        , container_name_(std::move(container_name)) {}

    const std::string& container_name() const { return container_name_; }

private:
    std::string container_name_;
};

class ContainerDoesNotExistError : public ContainerError {
public:
    explicit ContainerDoesNotExistError(const std::string& name)
        : ContainerError("Container does not exist: " + name, name) {}
};

class ContainerAlreadyExistsError : public ContainerError {
public:
    explicit ContainerAlreadyExistsError(const std::string& name)
        : ContainerError("Container already exists: " + name, name) {}
};

class ContainerIsNotEmptyError : public ContainerError {
public:
    explicit ContainerIsNotEmptyError(const std::string& name)
        : ContainerError("Container is not empty: " + name, name) {}
};

// Raised locally, before any request is sent
class InvalidContainerNameError : public ContainerError {
public:
    InvalidContainerNameError(const std::string& reason, const std::string& name)
        : ContainerError("Invalid container name '" + name + "': " + reason, name) {}
};

class ObjectError : public StorageError {
public:
    ObjectError(const std::string& message, std::string object_name)
        : StorageError(message)
        , object_name_(std::move(object_name)) {}

    const std::string& object_name() const { return object_name_; }

private:
    std::string object_name_;
};

class ObjectDoesNotExistError : public ObjectError {
public:
    explicit ObjectDoesNotExistError(const std::string& name)
        : ObjectError("Object does not exist: " + name, name) {}
};

// Local digest of the transmitted bytes differs from the server's ETag.
// The data has already been written when this is raised.
class ObjectHashMismatchError : public ObjectError {
public:
    ObjectHashMismatchError(const std::string& object_name,
                            std::string expected, std::string actual)
        : ObjectError("Hash checksum does not match for " + object_name +
                      " (expected=" + expected + ", actual=" + actual + ")",
                      object_name)
        , expected_(std::move(expected))
        , actual_(std::move(actual)) {}

    const std::string& expected() const { return expected_; }
    const std::string& actual() const { return actual_; }

private:
    std::string expected_;
    std::string actual_;
};

} // namespace swiftstore
