#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace rowfeed {

/**
 * @brief Base of all errors raised while opening or reading a source. Carries the
 * descriptor of the offending source when it is known.
 */
class SourceException : public std::runtime_error {
   public:
    explicit SourceException(const std::string& message, std::optional<std::string> source = std::nullopt)
        : std::runtime_error(source ? message + " [source: " + *source + "]" : message),
          source_(std::move(source)) {}

    const std::optional<std::string>& getSource() const noexcept { return source_; }

   private:
    std::optional<std::string> source_;
};

class SourceUnavailable : public SourceException {
   public:
    explicit SourceUnavailable(const std::string& message, std::optional<std::string> source = std::nullopt)
        : SourceException(message, std::move(source)) {}
};

class EmptySource : public SourceException {
   public:
    explicit EmptySource(const std::string& message, std::optional<std::string> source = std::nullopt)
        : SourceException(message, std::move(source)) {}
};

class UnresolvableFiletype : public SourceException {
   public:
    UnresolvableFiletype(const std::string& message, std::string path)
        : SourceException(message + ": " + path), path_(std::move(path)) {}

    const std::string& getPath() const noexcept { return path_; }

   private:
    std::string path_;
};

class UnsupportedMode : public SourceException {
   public:
    explicit UnsupportedMode(const std::string& message, std::optional<std::string> source = std::nullopt)
        : SourceException(message, std::move(source)) {}
};

/**
 * @brief Malformed row data: column length mismatch, unparsable records or columns that
 * drift between files.
 */
class SchemaViolation : public SourceException {
   public:
    explicit SchemaViolation(const std::string& message, std::optional<std::string> column = std::nullopt,
                             std::optional<std::string> path = std::nullopt)
        : SourceException(message + (column ? " (column '" + *column + "')" : "") +
                          (path ? " in " + *path : "")),
          column_(std::move(column)),
          path_(std::move(path)) {}

    const std::optional<std::string>& getColumn() const noexcept { return column_; }
    const std::optional<std::string>& getPath() const noexcept { return path_; }

   private:
    std::optional<std::string> column_;
    std::optional<std::string> path_;
};

class InvalidConfiguration : public SourceException {
   public:
    InvalidConfiguration(const std::string& key, const std::string& message)
        : SourceException("Invalid configuration '" + key + "': " + message), key_(key) {}

    const std::string& getKey() const noexcept { return key_; }

   private:
    std::string key_;
};

class SourceStateError : public SourceException {
   public:
    explicit SourceStateError(const std::string& message, std::optional<std::string> source = std::nullopt)
        : SourceException("Invalid source state: " + message, std::move(source)) {}
};

}  // namespace rowfeed
