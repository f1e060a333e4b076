#ifndef DPDFPARSER_HH
#define DPDFPARSER_HH

#include <deltapdf/DPDFExc.hh>
#include <deltapdf/DPDFObjectHandle.hh>
#include <deltapdf/DPDFTokenizer.hh>
#include <deltapdf/InputSource.hh>

#include <string>
#include <vector>

class DPDF;

/// @class  DPDFParser
/// @brief  Internal parser for PDF objects.
/// @par
///         The parser reads one value at a time from an input source. Arrays and dictionaries are
///         handled with an explicit stack so that deeply nested input cannot exhaust the call
///         stack. Indirect references are returned as reference objects; nothing is resolved
///         except an indirect stream /Length, which is looked up through the owning DPDF.
class DPDFParser
{
  public:
    /// @brief Maximum nesting depth of arrays and dictionaries.
    static constexpr size_t max_nesting = 500;

    /// @brief Construct a parser.
    /// @param input The input source to read from.
    /// @param object_description Description of the object for error messages.
    /// @param context The DPDF the input belongs to, or nullptr if parsing standalone. Without a
    ///        context, warnings are dropped and indirect stream lengths are found by scanning.
    DPDFParser(InputSource& input, std::string const& object_description, DPDF* context) :
        input_(input),
        object_description_(object_description),
        context_(context)
    {
    }

    /// @brief Parse one value. A dictionary followed by the stream keyword becomes a stream. The
    ///        input is left positioned after the value.
    DPDFObjectHandle parse();

    /// @brief Parse "n g obj value endobj". The header must match og unless og is DPDFObjGen().
    ///        The result carries the object number and generation from the header.
    DPDFObjectHandle parseIndirect(DPDFObjGen og = DPDFObjGen());

  private:
    enum parser_state_e { st_array, st_dictionary_key, st_dictionary_value };

    struct StackFrame
    {
        StackFrame(parser_state_e state, dpdf_offset_t offset) :
            state(state),
            offset(offset)
        {
        }

        parser_state_e state;
        dpdf_offset_t offset;
        std::vector<DPDFObjectHandle> olist;
        DPDFObjectHandle::dict_items_t dict;
        std::string key;
    };

    DPDFObjectHandle parseValue();
    bool add(DPDFObjectHandle const& obj, dpdf_offset_t offset);
    long long toInteger(DPDFTokenizer::Token const& token);
    std::string expected() const;

    void readStream(DPDFObjectHandle& object);
    size_t checkLength(dpdf_offset_t stream_offset, long long declared);
    bool scanForEndstream(dpdf_offset_t stream_offset, size_t& length);

    DPDFExc error(dpdf_error_code_e code, dpdf_offset_t offset, std::string const& msg) const;
    DPDFExc unexpected(DPDFTokenizer::Token const& token) const;
    void warn(DPDFExc const& e);

    InputSource& input_;
    std::string object_description_;
    DPDF* context_;
    DPDFTokenizer tokenizer_;
    DPDFObjGen og_;

    std::vector<StackFrame> stack_;
    int int_count_{0};
    long long int_buffer_[2]{0, 0};
    dpdf_offset_t int_offset_[2]{0, 0};
};

#endif // DPDFPARSER_HH
