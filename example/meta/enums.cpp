/**
 * Examples for enumkit::meta enumeration metadata
 *
 * This file demonstrates:
 * 1. Describing an enumeration with EnumTraits
 * 2. Names, values and member queries
 * 3. Formatting in the built-in formats
 * 4. Parsing, including ignore-case and attribute formats
 * 5. Flag enumerations
 * 6. Custom formats
 * 7. Runtime lookup through the registry
 */

#include "enumkit/meta/enums.hpp"

#include <any>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>

#include <spdlog/spdlog.h>

using namespace enumkit::meta;

enum class HttpStatus : short {
    OK = 200,
    Created = 201,
    NoContent = 204,
    BadRequest = 400,
    NotFound = 404,
    ServerError = 500
};

enum class Permission : unsigned char {
    None = 0x00,
    Read = 0x01,
    Write = 0x02,
    Execute = 0x04,
    ReadWrite = Read | Write
};

template <>
struct enumkit::meta::EnumTraits<HttpStatus> {
    static auto fields() -> std::vector<EnumField<HttpStatus>> {
        return {
            ENUMKIT_FIELD(HttpStatus, OK, description("Request succeeded"),
                          enumMember("ok")),
            ENUMKIT_FIELD(HttpStatus, Created,
                          description("Resource created"),
                          enumMember("created")),
            ENUMKIT_FIELD(HttpStatus, NoContent, enumMember("no_content")),
            ENUMKIT_FIELD(HttpStatus, BadRequest,
                          description("Invalid request"),
                          display("Bad Request", 2)),
            ENUMKIT_FIELD(HttpStatus, NotFound,
                          description("Resource not found"),
                          display("Not Found", 1)),
            ENUMKIT_FIELD(HttpStatus, ServerError,
                          description("Server encountered an error")),
        };
    }
};

ENUMKIT_ENUM_TRAITS(Permission, true, None, Read, Write, Execute, ReadWrite);

void printHeader(const std::string& title) {
    std::cout << "\n=========================================================="
              << std::endl;
    std::cout << "  " << title << std::endl;
    std::cout << "=========================================================="
              << std::endl;
}

void printValue(const std::string& label, const std::string& value) {
    std::cout << std::left << std::setw(44) << label << ": " << value
              << std::endl;
}

void printValue(const std::string& label,
                const std::optional<std::string>& value) {
    printValue(label, value.value_or("nullopt"));
}

void printValue(const std::string& label, bool value) {
    printValue(label, std::string(value ? "true" : "false"));
}

int main() {
    spdlog::set_level(spdlog::level::debug);

    using Status = Enums<HttpStatus>;
    using Permissions = FlagEnums<Permission>;

    //=========================================================================
    // 1. Members
    //=========================================================================
    printHeader("1. Members");

    printValue("typeName", std::string(Status::typeName()));
    printValue("member count", std::to_string(Status::getMemberCount()));
    printValue("isContiguous", Status::isContiguous());
    for (const auto& member : Status::getMembers()) {
        printValue("  " + member.name(), member.asString("D"));
    }
    std::cout << "Display order:";
    for (auto name : Status::getNames(EnumMemberSelection::DisplayOrder)) {
        std::cout << " " << name;
    }
    std::cout << std::endl;

    //=========================================================================
    // 2. Validation
    //=========================================================================
    printHeader("2. Validation");

    printValue("isDefined(404)", Status::isDefined(HttpStatus::NotFound));
    printValue("isDefined(418)", Status::isDefined(static_cast<HttpStatus>(418)));
    if (auto status = Status::tryToObject(201, EnumValidation::IsDefined)) {
        printValue("tryToObject(201)", Status::asString(*status));
    }
    try {
        static_cast<void>(Status::validate(static_cast<HttpStatus>(418),
                                           "status"));
    } catch (const enumkit::error::InvalidArgument& e) {
        printValue("validate(418)", e.getMessage());
    }

    //=========================================================================
    // 3. Formatting
    //=========================================================================
    printHeader("3. Formatting");

    printValue("asString(NotFound)", Status::asString(HttpStatus::NotFound));
    printValue("format(NotFound, \"X\")",
               Status::format(HttpStatus::NotFound, "X"));
    printValue("format(NotFound, Description)",
               Status::format(HttpStatus::NotFound, EnumFormat::Description));
    printValue("format(NoContent, Description)",
               Status::format(HttpStatus::NoContent, EnumFormat::Description));
    printValue("format(NoContent, {Description, EnumMemberValue})",
               Status::format(HttpStatus::NoContent,
                              {EnumFormat::Description,
                               EnumFormat::EnumMemberValue}));
    printValue("asString(418)", Status::asString(static_cast<HttpStatus>(418)));

    //=========================================================================
    // 4. Parsing
    //=========================================================================
    printHeader("4. Parsing");

    printValue("parse(\"notfound\", ignoreCase)",
               Status::asString(Status::parse("notfound", true)));
    printValue("parse(\"created\", EnumMemberValue)",
               Status::asString(
                   Status::parse("created", false,
                                 {EnumFormat::EnumMemberValue})));
    printValue("parse(\"Bad Request\", DisplayName)",
               Status::asString(Status::parse("Bad Request", false,
                                              {EnumFormat::DisplayName})));
    printValue("tryParse(\"Teapot\")",
               Status::tryParse("Teapot").has_value());
    try {
        static_cast<void>(Status::parse("70000"));
    } catch (const enumkit::error::Overflow& e) {
        printValue("parse(\"70000\")", e.getMessage());
    }

    //=========================================================================
    // 5. Flags
    //=========================================================================
    printHeader("5. Flags");

    const auto readExecute = Permissions::combineFlags(Permission::Read,
                                                        Permission::Execute);
    printValue("combineFlags(Read, Execute)",
               Enums<Permission>::asString(readExecute));
    printValue("formatFlags(7, \" | \")",
               Permissions::formatFlags(static_cast<Permission>(7), " | "));
    printValue("asString(ReadWrite)",
               Enums<Permission>::asString(Permission::ReadWrite));
    printValue("parseFlags(\"read | write\", ignoreCase, \"|\")",
               Enums<Permission>::asString(
                   Permissions::parseFlags("read | write", true, "|")));
    printValue("hasAllFlags(ReadWrite, Write)",
               Permissions::hasAllFlags(Permission::ReadWrite,
                                        Permission::Write));
    printValue("toggleFlags(Read)",
               Enums<Permission>::asString(
                   Permissions::toggleFlags(Permission::Read)));
    std::cout << "getFlags(7):";
    for (auto flag : Permissions::getFlags(static_cast<Permission>(7))) {
        std::cout << " " << Enums<Permission>::asString(flag);
    }
    std::cout << std::endl;

    //=========================================================================
    // 6. Custom formats
    //=========================================================================
    printHeader("6. Custom formats");

    const auto codeFormat = registerCustomEnumFormat(
        [](const EnumMemberBase& member) -> std::optional<std::string> {
            return "HTTP " + member.toDecimalString();
        });
    printValue("format(ServerError, custom)",
               Status::format(HttpStatus::ServerError, codeFormat));
    printValue("parse(\"HTTP 204\", custom)",
               Status::asString(
                   Status::parse("HTTP 204", false, {codeFormat})));

    //=========================================================================
    // 7. Registry
    //=========================================================================
    printHeader("7. Registry");

    const std::any boxed = HttpStatus::BadRequest;
    auto info = getEnumInfo(boxed);
    printValue("info->typeName()", std::string(info->typeName()));
    printValue("info->asString(boxed)", info->asString(boxed));
    printValue("registered enums",
               std::to_string(EnumRegistry::getInstance().size()));

    return 0;
}
