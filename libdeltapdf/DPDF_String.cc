#include <deltapdf/DPDFObject_private.hh>

#include <deltapdf/DUtil.hh>

std::string
DPDF_String::unparse() const
{
    if (hex) {
        return "<" + DUtil::hex_encode(val) + ">";
    }
    std::string result = "(";
    for (char ch: val) {
        switch (ch) {
        case '\n':
            result += "\\n";
            break;

        case '\r':
            result += "\\r";
            break;

        case '\t':
            result += "\\t";
            break;

        case '\b':
            result += "\\b";
            break;

        case '\f':
            result += "\\f";
            break;

        case '(':
            result += "\\(";
            break;

        case ')':
            result += "\\)";
            break;

        case '\\':
            result += "\\\\";
            break;

        default:
            if (ch >= 32 && ch <= 126) {
                result += ch;
            } else {
                auto code = static_cast<int>(static_cast<unsigned char>(ch));
                result += "\\" + DUtil::int_to_string_base(code, 8, 3);
            }
            break;
        }
    }
    result += ")";
    return result;
}
