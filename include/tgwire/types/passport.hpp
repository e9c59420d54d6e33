#pragma once

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

#include "tgwire/codec/variant.hpp"
#include "tgwire/codec/wire.hpp"

namespace tgwire::types {

using codec::field;

// Telegram Passport element errors. `type` names the passport element
// ("passport", "utility_bill", ...); `source` is fixed per record.

/// Error in a data field; `data_hash` is the base64 hash of the data.
struct PassportElementErrorDataField {
    std::string source = "data";
    std::string type;
    std::string field_name;
    std::string data_hash;
    std::string message;

    static constexpr auto wire_fields() {
        return std::tuple{
            field("source", &PassportElementErrorDataField::source),
            field("type", &PassportElementErrorDataField::type),
            field("field_name", &PassportElementErrorDataField::field_name),
            field("data_hash", &PassportElementErrorDataField::data_hash),
            field("message", &PassportElementErrorDataField::message),
        };
    }

    auto operator==(const PassportElementErrorDataField&) const -> bool = default;
};

struct PassportElementErrorFrontSide {
    std::string source = "front_side";
    std::string type;
    std::string file_hash;
    std::string message;

    static constexpr auto wire_fields() {
        return std::tuple{
            field("source", &PassportElementErrorFrontSide::source),
            field("type", &PassportElementErrorFrontSide::type),
            field("file_hash", &PassportElementErrorFrontSide::file_hash),
            field("message", &PassportElementErrorFrontSide::message),
        };
    }

    auto operator==(const PassportElementErrorFrontSide&) const -> bool = default;
};

struct PassportElementErrorReverseSide {
    std::string source = "reverse_side";
    std::string type;
    std::string file_hash;
    std::string message;

    static constexpr auto wire_fields() {
        return std::tuple{
            field("source", &PassportElementErrorReverseSide::source),
            field("type", &PassportElementErrorReverseSide::type),
            field("file_hash", &PassportElementErrorReverseSide::file_hash),
            field("message", &PassportElementErrorReverseSide::message),
        };
    }

    auto operator==(const PassportElementErrorReverseSide&) const -> bool = default;
};

struct PassportElementErrorSelfie {
    std::string source = "selfie";
    std::string type;
    std::string file_hash;
    std::string message;

    static constexpr auto wire_fields() {
        return std::tuple{
            field("source", &PassportElementErrorSelfie::source),
            field("type", &PassportElementErrorSelfie::type),
            field("file_hash", &PassportElementErrorSelfie::file_hash),
            field("message", &PassportElementErrorSelfie::message),
        };
    }

    auto operator==(const PassportElementErrorSelfie&) const -> bool = default;
};

struct PassportElementErrorFile {
    std::string source = "file";
    std::string type;
    std::string file_hash;
    std::string message;

    static constexpr auto wire_fields() {
        return std::tuple{
            field("source", &PassportElementErrorFile::source),
            field("type", &PassportElementErrorFile::type),
            field("file_hash", &PassportElementErrorFile::file_hash),
            field("message", &PassportElementErrorFile::message),
        };
    }

    auto operator==(const PassportElementErrorFile&) const -> bool = default;
};

/// Error in a list of scans; one hash per file.
struct PassportElementErrorFiles {
    std::string source = "files";
    std::string type;
    std::vector<std::string> file_hashes;
    std::string message;

    static constexpr auto wire_fields() {
        return std::tuple{
            field("source", &PassportElementErrorFiles::source),
            field("type", &PassportElementErrorFiles::type),
            field("file_hashes", &PassportElementErrorFiles::file_hashes),
            field("message", &PassportElementErrorFiles::message),
        };
    }

    auto operator==(const PassportElementErrorFiles&) const -> bool = default;
};

struct PassportElementErrorTranslationFile {
    std::string source = "translation_file";
    std::string type;
    std::string file_hash;
    std::string message;

    static constexpr auto wire_fields() {
        return std::tuple{
            field("source", &PassportElementErrorTranslationFile::source),
            field("type", &PassportElementErrorTranslationFile::type),
            field("file_hash", &PassportElementErrorTranslationFile::file_hash),
            field("message", &PassportElementErrorTranslationFile::message),
        };
    }

    auto operator==(const PassportElementErrorTranslationFile&) const -> bool = default;
};

struct PassportElementErrorTranslationFiles {
    std::string source = "translation_files";
    std::string type;
    std::vector<std::string> file_hashes;
    std::string message;

    static constexpr auto wire_fields() {
        return std::tuple{
            field("source", &PassportElementErrorTranslationFiles::source),
            field("type", &PassportElementErrorTranslationFiles::type),
            field("file_hashes", &PassportElementErrorTranslationFiles::file_hashes),
            field("message", &PassportElementErrorTranslationFiles::message),
        };
    }

    auto operator==(const PassportElementErrorTranslationFiles&) const -> bool = default;
};

struct PassportElementErrorUnspecified {
    std::string source = "unspecified";
    std::string type;
    std::string element_hash;
    std::string message;

    static constexpr auto wire_fields() {
        return std::tuple{
            field("source", &PassportElementErrorUnspecified::source),
            field("type", &PassportElementErrorUnspecified::type),
            field("element_hash", &PassportElementErrorUnspecified::element_hash),
            field("message", &PassportElementErrorUnspecified::message),
        };
    }

    auto operator==(const PassportElementErrorUnspecified&) const -> bool = default;
};

struct PassportElementError : codec::Union<PassportElementError,
                                           PassportElementErrorDataField,
                                           PassportElementErrorFrontSide,
                                           PassportElementErrorReverseSide,
                                           PassportElementErrorSelfie,
                                           PassportElementErrorFile,
                                           PassportElementErrorFiles,
                                           PassportElementErrorTranslationFile,
                                           PassportElementErrorTranslationFiles,
                                           PassportElementErrorUnspecified> {
    using Union::Union;

    static constexpr std::string_view kind_name = "PassportElementError";
    static constexpr std::array<std::string_view, 9> alternative_names{
        "PassportElementErrorDataField", "PassportElementErrorFrontSide",
        "PassportElementErrorReverseSide", "PassportElementErrorSelfie",
        "PassportElementErrorFile", "PassportElementErrorFiles",
        "PassportElementErrorTranslationFile", "PassportElementErrorTranslationFiles",
        "PassportElementErrorUnspecified"};
};

} // namespace tgwire::types
