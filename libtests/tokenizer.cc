#include <deltapdf/assert_test.h>

#include <deltapdf/BufferInputSource.hh>
#include <deltapdf/DPDFExc.hh>
#include <deltapdf/DPDFTokenizer.hh>

#include <iostream>
#include <vector>

using tt = DPDFTokenizer::token_type_e;

static std::vector<DPDFTokenizer::Token>
tokenize(std::string const& data)
{
    BufferInputSource input("tokens", data);
    DPDFTokenizer tokenizer;
    std::vector<DPDFTokenizer::Token> result;
    while (true) {
        auto t = tokenizer.readToken(input, "test", true);
        result.push_back(t);
        if (t.getType() == tt::tt_eof) {
            break;
        }
    }
    return result;
}

static void
test_basic()
{
    auto t = tokenize("<< /Type /Page /Count 3 /Scale -1.5 >> [ true false null ] R obj");
    std::vector<tt> types = {
        tt::tt_dict_open,
        tt::tt_name,
        tt::tt_name,
        tt::tt_name,
        tt::tt_integer,
        tt::tt_name,
        tt::tt_real,
        tt::tt_dict_close,
        tt::tt_array_open,
        tt::tt_bool,
        tt::tt_bool,
        tt::tt_null,
        tt::tt_array_close,
        tt::tt_word,
        tt::tt_word,
        tt::tt_eof};
    assert(t.size() == types.size());
    for (size_t i = 0; i < types.size(); ++i) {
        assert(t[i].getType() == types[i]);
    }
    assert(t[1].getValue() == "/Type");
    assert(t[4].getValue() == "3");
    assert(t[4].isInteger());
    assert(t[6].getValue() == "-1.5");
    assert(t[13].isWord("R"));
    assert(t[14].isWord("obj"));
    assert(!t[14].isWord("endobj"));
    // Offsets point at the first character of each token
    assert(t[0].getOffset() == 0);
    assert(t[1].getOffset() == 3);
}

static void
test_numbers()
{
    auto t = tokenize("42 +17 -3 .5 4. -.002 1.2.3 12abc");
    assert(t[0].getType() == tt::tt_integer && t[0].getValue() == "42");
    assert(t[1].getType() == tt::tt_integer && t[1].getValue() == "+17");
    assert(t[2].getType() == tt::tt_integer && t[2].getValue() == "-3");
    assert(t[3].getType() == tt::tt_real && t[3].getValue() == ".5");
    assert(t[4].getType() == tt::tt_real && t[4].getValue() == "4.");
    assert(t[5].getType() == tt::tt_real && t[5].getValue() == "-.002");
    assert(t[6].getType() == tt::tt_word);
    assert(t[7].getType() == tt::tt_word && t[7].getValue() == "12abc");
}

static void
test_strings()
{
    auto t = tokenize(
        "(simple) (nested (parens) ok) (esc\\n\\t\\(\\)\\\\) (\\101\\60x) (line\\\ncont) "
        "(cr\r\nlf) <414243> <41 42\n4> <>");
    assert(t[0].getType() == tt::tt_string);
    assert(t[0].getValue() == "simple");
    assert(!t[0].isHexString());
    assert(t[1].getValue() == "nested (parens) ok");
    assert(t[2].getValue() == "esc\n\t()\\");
    assert(t[3].getValue() == "A0x");
    assert(t[4].getValue() == "linecont");
    assert(t[5].getValue() == "cr\nlf");
    assert(t[6].getValue() == "ABC");
    assert(t[6].isHexString());
    assert(t[6].getRawValue() == "<414243>");
    // An odd number of digits is padded with 0
    assert(t[7].getValue() == "AB@");
    assert(t[8].getValue().empty());
    assert(t[8].isHexString());
    assert(t[9].getType() == tt::tt_eof);
}

static void
test_names()
{
    auto t = tokenize("/A#20B /#41#42 /a#zz / /x%comment\n/y");
    assert(t[0].getValue() == "/A B");
    assert(t[0].getRawValue() == "/A#20B");
    assert(t[1].getValue() == "/AB");
    // A # not followed by two hex digits is kept
    assert(t[2].getValue() == "/a#zz");
    assert(t[3].getType() == tt::tt_name && t[3].getValue() == "/");
    assert(t[4].getValue() == "/x");
    assert(t[5].getValue() == "/y");
    assert(t[6].getType() == tt::tt_eof);

    auto bad = tokenize("/a#00b");
    assert(bad[0].getType() == tt::tt_bad);
    assert(bad[0].getErrorMessage() == "null character not allowed in name token");
}

static void
test_comments_and_eof()
{
    auto t = tokenize("% leading comment\n1 % trailing");
    assert(t.size() == 2);
    assert(t[0].getValue() == "1");
    assert(t[1].getType() == tt::tt_eof);

    auto empty = tokenize("   \n\t ");
    assert(empty.size() == 1);
    assert(empty[0].getType() == tt::tt_eof);
}

static void
test_bad_tokens()
{
    auto t = tokenize(") } <4x> (unterminated");
    assert(t[0].getType() == tt::tt_bad);
    assert(t[0].getErrorMessage() == "unexpected )");
    assert(t[1].getType() == tt::tt_bad);
    assert(t[2].getType() == tt::tt_bad);
    assert(t[2].getErrorMessage() == "invalid character (x) in hexstring");

    // Bad tokens throw unless explicitly allowed
    BufferInputSource input("bad input", std::string_view("  )"));
    DPDFTokenizer tokenizer;
    try {
        tokenizer.readToken(input, "test");
        assert(false);
    } catch (DPDFExc& e) {
        assert(e.getErrorCode() == dpdf_e_lex);
        assert(e.getFilePosition() == 2);
        assert(e.getFilename() == "bad input");
    }

    BufferInputSource eof_input("eof input", std::string_view("(abc"));
    auto eof_token = tokenizer.readToken(eof_input, "test", true);
    assert(eof_token.getType() == tt::tt_bad);
    assert(eof_token.getErrorMessage() == "EOF while reading token");
}

static void
test_peek_and_max_len()
{
    BufferInputSource input("peek", std::string_view("startxref 12345"));
    DPDFTokenizer tokenizer;
    auto peeked = tokenizer.peekToken(input, "test");
    assert(peeked.isWord("startxref"));
    assert(input.tell() == 0);
    assert(tokenizer.readToken(input, "test").isWord("startxref"));
    assert(tokenizer.readToken(input, "test").getValue() == "12345");

    BufferInputSource long_input("long", std::string_view("12345678901234 5"));
    auto t = tokenizer.readToken(long_input, "test", true, 10);
    assert(t.getType() == tt::tt_bad);
    assert(t.getErrorMessage() == "exceeded allowable length while reading token");
}

int
main()
{
    test_basic();
    test_numbers();
    test_strings();
    test_names();
    test_comments_and_eof();
    test_bad_tokens();
    test_peek_and_max_len();
    std::cout << "tokenizer tests done" << '\n';
    return 0;
}
