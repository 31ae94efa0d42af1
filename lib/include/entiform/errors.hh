//
// Error kinds raised by schema construction and conversion.
//

#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace entiform {

/// One validation finding.
struct field_error {
    std::string path;     ///< Dotted field path ("owner.tags.1")
    std::string code;     ///< Symbolic kind ("required", "invalid_number", "min_length", ...)
    std::string message;  ///< Human-readable text

    /// Format as "path: message [code]"
    [[nodiscard]] std::string format() const;

    bool operator==(const field_error&) const = default;
};

/// Malformed field descriptors or an unresolvable schema name.
/// Raised while a schema is built or a pipeline is compiled; never recovered.
class schema_definition_error : public std::runtime_error {
public:
    schema_definition_error(const std::string& schema_name, const std::string& msg)
        : std::runtime_error(build_message(schema_name, msg)),
          schema_name_(schema_name) {}

    [[nodiscard]] const std::string& schema_name() const { return schema_name_; }

private:
    std::string schema_name_;

    static std::string build_message(const std::string& schema_name, const std::string& msg);
};

/// Failure while running a conversion pipeline.
class conversion_error : public std::runtime_error {
public:
    conversion_error(const std::string& path, const std::string& msg)
        : std::runtime_error(path.empty() ? msg : msg + " (at '" + path + "')"),
          path_(path) {}

    /// Dotted path of the offending field, empty for the root value
    [[nodiscard]] const std::string& path() const { return path_; }

private:
    std::string path_;
};

class no_matching_union_variant : public conversion_error {
public:
    no_matching_union_variant(const std::string& path,
                              const std::string& field_name,
                              const std::vector<std::string>& discriminants)
        : conversion_error(path, build_message(field_name, discriminants)),
          field_(field_name),
          discriminants_(discriminants) {}

    [[nodiscard]] const std::string& field() const { return field_; }
    /// Candidates in the order their guards were evaluated
    [[nodiscard]] const std::vector<std::string>& discriminants() const { return discriminants_; }

private:
    std::string field_;
    std::vector<std::string> discriminants_;

    static std::string build_message(const std::string& field_name,
                                     const std::vector<std::string>& discriminants);
};

class invalid_enum_value : public conversion_error {
public:
    invalid_enum_value(const std::string& path,
                       const std::string& field_name,
                       const std::string& offending,
                       const std::vector<std::string>& valid_values)
        : conversion_error(path, build_message(field_name, offending, valid_values)),
          offending_(offending),
          valid_values_(valid_values) {}

    [[nodiscard]] const std::string& offending() const { return offending_; }
    [[nodiscard]] const std::vector<std::string>& valid_values() const { return valid_values_; }

private:
    std::string offending_;
    std::vector<std::string> valid_values_;

    static std::string build_message(const std::string& field_name,
                                     const std::string& offending,
                                     const std::vector<std::string>& valid_values);
};

/// Aggregate of every field error found by a validator.
class validation_failed : public std::runtime_error {
public:
    explicit validation_failed(std::vector<field_error> errors)
        : std::runtime_error(build_message(errors)),
          errors_(std::move(errors)) {}

    [[nodiscard]] const std::vector<field_error>& errors() const { return errors_; }

private:
    std::vector<field_error> errors_;

    static std::string build_message(const std::vector<field_error>& errors);
};

class serializer_not_found : public std::runtime_error {
public:
    explicit serializer_not_found(const std::string& name)
        : std::runtime_error("Unknown Serializer: '" + name + "'"),
          name_(name) {}

    [[nodiscard]] const std::string& name() const { return name_; }

private:
    std::string name_;
};

} // namespace entiform
