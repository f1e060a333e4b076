#include <deltapdf/DPDFExc.hh>

namespace
{
    std::string
    format_what(
        std::string const& filename,
        std::string const& object,
        dpdf_offset_t offset,
        std::string const& message)
    {
        std::string location = object;
        if (offset > 0) {
            if (!location.empty()) {
                location += ", ";
            }
            location += "offset " + std::to_string(offset);
        }
        std::string prefix = filename;
        if (prefix.empty()) {
            prefix = location;
        } else if (!location.empty()) {
            prefix += " (" + location + ")";
        }
        return prefix.empty() ? message : prefix + ": " + message;
    }
} // namespace

DPDFExc::DPDFExc(
    dpdf_error_code_e error_code,
    std::string const& filename,
    std::string const& object,
    dpdf_offset_t offset,
    std::string const& message) :
    std::runtime_error(format_what(filename, object, offset, message)),
    error_code(error_code),
    filename(filename),
    object(object),
    offset(offset > 0 ? offset : 0),
    message(message)
{
}

dpdf_error_code_e
DPDFExc::getErrorCode() const
{
    return error_code;
}

std::string const&
DPDFExc::getFilename() const
{
    return filename;
}

std::string const&
DPDFExc::getObject() const
{
    return object;
}

dpdf_offset_t
DPDFExc::getFilePosition() const
{
    return offset;
}

std::string const&
DPDFExc::getMessageDetail() const
{
    return message;
}

bool
DPDFExc::isLexError() const
{
    return error_code == dpdf_e_lex;
}

bool
DPDFExc::isParseError() const
{
    switch (error_code) {
    case dpdf_e_unexpected_token:
    case dpdf_e_unexpected_eof:
    case dpdf_e_invalid_object:
    case dpdf_e_invalid_xref:
    case dpdf_e_corrupted:
    case dpdf_e_unsupported:
        return true;
    default:
        return false;
    }
}

char const*
DPDFExc::describe(dpdf_error_code_e code)
{
    switch (code) {
    case dpdf_e_success:
        return "success";
    case dpdf_e_internal:
        return "internal error";
    case dpdf_e_system:
        return "system error";
    case dpdf_e_lex:
        return "lexical error";
    case dpdf_e_unexpected_token:
        return "unexpected token";
    case dpdf_e_unexpected_eof:
        return "unexpected end of file";
    case dpdf_e_invalid_object:
        return "invalid object";
    case dpdf_e_invalid_xref:
        return "invalid cross-reference data";
    case dpdf_e_corrupted:
        return "corrupted file";
    case dpdf_e_unsupported:
        return "unsupported feature";
    }
    return "unknown error";
}
