#ifndef DPDFTOKENIZER_PRIVATE_HH
#define DPDFTOKENIZER_PRIVATE_HH

#include <deltapdf/DPDFTokenizer.hh>

namespace deltapdf
{
    // The scanner behind DPDFTokenizer. The input source is the cursor: each scan starts at
    // input.tell() and leaves the input positioned just after the token. A delimiter that ends a
    // name, number or keyword is not consumed, so the EOL after "stream" is still there for the
    // parser.
    class Tokenizer
    {
      public:
        Tokenizer() = default;
        Tokenizer(Tokenizer const&) = delete;
        Tokenizer& operator=(Tokenizer const&) = delete;

        DPDFTokenizer::Token readToken(
            InputSource& input, std::string const& context, bool allow_bad, size_t max_len);

      private:
        // Each scan function is called with the token's first character already consumed. It
        // sets type and value, or calls bad().
        void scanRegular(InputSource& input);
        void scanLiteralString(InputSource& input);
        void scanEscape(InputSource& input);
        void scanLessThan(InputSource& input);
        void scanGreaterThan(InputSource& input);
        void scanName(InputSource& input);

        // Skip white space and comments. Returns false at EOF.
        bool skipSpace(InputSource& input);
        // Read the next character of the current token. Returns false at EOF or, after marking
        // the token bad, when the token has grown past max_len.
        bool next(InputSource& input, char& ch);
        void bad(std::string const& message);

        dpdf_offset_t start{0};
        size_t max_len{0};
        DPDFTokenizer::token_type_e type{DPDFTokenizer::tt_bad};
        std::string value;
        std::string error_message;
        bool hex{false};
    };
} // namespace deltapdf

#endif // DPDFTOKENIZER_PRIVATE_HH
