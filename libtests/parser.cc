#include <deltapdf/assert_test.h>

// This program tests parsing and serializing objects without a document

#include <deltapdf/DPDFExc.hh>
#include <deltapdf/DPDFObjectHandle.hh>
#include <deltapdf/DPDFParser.hh>

#include <iostream>
#include <stdexcept>
#include <string>

static void
expect_error(std::string const& str, dpdf_error_code_e code)
{
    try {
        DPDFObjectHandle::parse(str, "test object");
        std::cerr << "no error parsing " << str << '\n';
        assert(false);
    } catch (DPDFExc& e) {
        if (e.getErrorCode() != code) {
            std::cerr << str << ": unexpected error: " << e.what() << '\n';
        }
        assert(e.getErrorCode() == code);
        assert(e.isLexError() == (code == dpdf_e_lex));
        assert(e.isParseError() == (code != dpdf_e_lex));
    }
}

static void
check_round_trip(std::string const& str)
{
    auto first = DPDFObjectHandle::parse(str);
    auto serialized = first.unparseResolved();
    auto second = DPDFObjectHandle::parse(serialized);
    if (second.unparseResolved() != serialized) {
        std::cerr << "round trip mismatch: " << serialized << " != " << second.unparseResolved()
                  << '\n';
    }
    assert(second.unparseResolved() == serialized);
    assert(first.getTypeCode() == second.getTypeCode());
}

static void
test_scalars()
{
    assert(DPDFObjectHandle::parse("null").isNull());
    assert(DPDFObjectHandle::parse("true").getBoolValue());
    assert(!DPDFObjectHandle::parse("false").getBoolValue());
    assert(DPDFObjectHandle::parse("  -42 ").getIntValue() == -42);
    // Reals keep their original text
    auto real = DPDFObjectHandle::parse("1.50");
    assert(real.isReal());
    assert(real.getRealValue() == "1.50");
    assert(real.getNumericValue() == 1.5);
    assert(real.unparse() == "1.50");
    auto name = DPDFObjectHandle::parse("/A#20B");
    assert(name.getName() == "/A B");
    assert(name.unparse() == "/A#20B");
    auto str = DPDFObjectHandle::parse("(a (nested) \\) string)");
    assert(str.getStringValue() == "a (nested) ) string");
    assert(str.unparse() == "(a \\(nested\\) \\) string)");
    auto hex = DPDFObjectHandle::parse("<00ff41>");
    assert(hex.isHexString());
    assert(hex.getStringValue() == std::string("\0\xff" "A", 3));
    assert(hex.unparse() == "<00ff41>");
    // Non-printable characters in literal strings are written in octal
    assert(DPDFObjectHandle::newString(std::string("a\001\377", 3)).unparse() == "(a\\001\\377)");
}

static void
test_containers()
{
    auto a = DPDFObjectHandle::parse("[1 0 R 2 3 R 4 5 [/x] << /K (v) >>]");
    assert(a.isArray());
    assert(a.getArrayNItems() == 6);
    assert(a.getArrayItem(0).isReference());
    assert(a.getArrayItem(0).getRefObjGen() == DPDFObjGen(1, 0));
    assert(a.getArrayItem(1).getRefObjGen() == DPDFObjGen(2, 3));
    assert(a.getArrayItem(2).getIntValue() == 4);
    assert(a.getArrayItem(3).getIntValue() == 5);
    assert(a.getArrayItem(4).getArrayItem(0).getName() == "/x");
    assert(a.getArrayItem(5).getKey("/K").getStringValue() == "v");
    assert(a.getArrayItem(6).isNull());
    assert(a.getArrayItem(-1).isNull());
    assert(a.unparse() == "[ 1 0 R 2 3 R 4 5 [ /x ] << /K (v) >> ]");

    // Duplicate keys keep their first position and take the last value
    auto d = DPDFObjectHandle::parse("<< /A 1 /B 2 /A 3 >>");
    auto keys = d.getKeys();
    assert(keys.size() == 2);
    assert(keys[0] == "/A" && keys[1] == "/B");
    assert(d.getKey("/A").getIntValue() == 3);
    assert(d.getKey("/Missing").isNull());
    assert(!d.hasKey("/Missing"));

    // References in dictionary values, including at the end
    auto r = DPDFObjectHandle::parse("<</Root 1 0 R/Size 7>>");
    assert(r.getKey("/Root").getRefObjGen() == DPDFObjGen(1, 0));
    assert(r.getKey("/Size").getIntValue() == 7);
    assert(r.unparse() == "<< /Root 1 0 R /Size 7 >>");

    auto empty = DPDFObjectHandle::parse("<<>>");
    assert(empty.isDictionary());
    assert(empty.getKeys().empty());
    assert(DPDFObjectHandle::parse("[]").getArrayNItems() == 0);
}

static void
test_round_trip()
{
    check_round_trip("<< /Type /Page /MediaBox [ 0 0 612 792 ] /Parent 3 0 R >>");
    check_round_trip("[ (text\\nwith\\\\escapes) <414243> /Na#23me -0.5 true null ]");
    check_round_trip("<< /Nested << /Deeper [ [ [ 1 ] ] ] >> /Ref 10 2 R >>");
    check_round_trip("(\\001\\002\\003 binary \\377)");
    check_round_trip("<< /Length 3 >>\nstream\nabc\nendstream");
}

static void
test_streams()
{
    auto s = DPDFObjectHandle::parse("<< /Length 5 >>\nstream\nhello\nendstream");
    assert(s.isStream());
    assert(s.getRawStreamData() == "hello");
    assert(s.getDict().getKey("/Length").getIntValue() == 5);
    assert(s.getStreamData() == "hello");

    // CRLF after the stream keyword
    auto crlf = DPDFObjectHandle::parse("<< /Length 2 >>stream\r\nab\r\nendstream");
    assert(crlf.getRawStreamData() == "ab");

    // A declared length up to two bytes longer than the data is accepted
    auto longer = DPDFObjectHandle::parse("<< /Length 7 >>\nstream\nhello\nendstream");
    assert(longer.getRawStreamData() == "hello");

    // Without a document, an indirect length is found by scanning for endstream
    auto indirect = DPDFObjectHandle::parse("<< /Length 9 0 R >>\nstream\nxyz\nendstream");
    assert(indirect.getRawStreamData() == "xyz");

    auto encoded = DPDFObjectHandle::parse(
        "<< /Length 7 /Filter /ASCIIHexDecode >>\nstream\n414243>\nendstream");
    assert(encoded.getStreamData() == "ABC");

    expect_error("<< /Length 3 >>\nstream\nhello\nendstream", dpdf_e_corrupted);
    expect_error("<< >>\nstream\nhello\nendstream", dpdf_e_invalid_object);
    expect_error("<< /Length -1 >>\nstream\nhello\nendstream", dpdf_e_invalid_object);
    expect_error("<< /Length /Five >>\nstream\nhello\nendstream", dpdf_e_invalid_object);
    expect_error("<< /Length 5 >>\nstream hello\nendstream", dpdf_e_corrupted);
    expect_error("<< /Length 5 >>\nstream\nhelloXXXX", dpdf_e_unexpected_eof);
}

static void
test_errors()
{
    expect_error("[1 2", dpdf_e_unexpected_eof);
    expect_error("<< /A 1", dpdf_e_unexpected_eof);
    expect_error("", dpdf_e_unexpected_eof);
    expect_error("<< 1 2 >>", dpdf_e_unexpected_token);
    expect_error("<< /A >>", dpdf_e_unexpected_token);
    expect_error("]", dpdf_e_unexpected_token);
    expect_error(">>", dpdf_e_unexpected_token);
    expect_error("endobj", dpdf_e_unexpected_token);
    expect_error("[ 1 2 foo ]", dpdf_e_unexpected_token);
    expect_error("1 2", dpdf_e_unexpected_token);
    expect_error("(a) (b)", dpdf_e_unexpected_token);
    expect_error("0 0 R", dpdf_e_invalid_object);
    expect_error("[ 3 -1 R ]", dpdf_e_invalid_object);
    expect_error("99999999999999999999", dpdf_e_invalid_object);
    expect_error(")", dpdf_e_lex);
    expect_error("<4x>", dpdf_e_lex);
    expect_error(std::string(DPDFParser::max_nesting + 1, '['), dpdf_e_invalid_object);

    try {
        DPDFObjectHandle::parse("[ 1 ] extra", "trailing test");
        assert(false);
    } catch (DPDFExc& e) {
        assert(e.getErrorCode() == dpdf_e_unexpected_token);
        assert(e.getMessageDetail() == "trailing data found parsing object from string");
        assert(e.getObject() == "trailing test");
        assert(e.getFilePosition() == 6);
    }

    // Nesting up to the limit is fine
    std::string deep(DPDFParser::max_nesting, '[');
    deep += std::string(DPDFParser::max_nesting, ']');
    assert(DPDFObjectHandle::parse(deep).isArray());
}

static void
test_exceptions()
{
    DPDFExc lex(dpdf_e_lex, "f.pdf", "object 1 0", 12, "bad token");
    assert(std::string(lex.what()) == "f.pdf (object 1 0, offset 12): bad token");
    assert(lex.isLexError());
    assert(!lex.isParseError());

    DPDFExc corrupt(dpdf_e_corrupted, "f.pdf", "", 0, "bad data");
    assert(std::string(corrupt.what()) == "f.pdf: bad data");
    assert(corrupt.getFilePosition() == 0);
    assert(corrupt.isParseError());

    DPDFExc located(dpdf_e_invalid_xref, "", "trailer", 7, "no /Size");
    assert(std::string(located.what()) == "trailer, offset 7: no /Size");

    DPDFExc bare(dpdf_e_system, "", "", -5, "disk full");
    assert(std::string(bare.what()) == "disk full");
    assert(bare.getFilePosition() == 0);
    assert(!bare.isLexError());
    assert(!bare.isParseError());

    assert(std::string(DPDFExc::describe(dpdf_e_unexpected_token)) == "unexpected token");
    assert(std::string(DPDFExc::describe(dpdf_e_unexpected_eof)) == "unexpected end of file");
    assert(std::string(DPDFExc::describe(dpdf_e_invalid_xref)) == "invalid cross-reference data");
    assert(
        std::string(DPDFExc::describe(static_cast<dpdf_error_code_e>(15))) == "unknown error");
}

static void
test_handle_api()
{
    auto dict = DPDFObjectHandle::newDictionary();
    dict.replaceKey("/Type", DPDFObjectHandle::newName("/Catalog"));
    dict.replaceKey("/Count", DPDFObjectHandle::newInteger(1));
    assert(dict.isDictionaryOfType("/Catalog"));
    assert(!dict.isDictionaryOfType("/Page"));
    dict.replaceKey("/Count", DPDFObjectHandle::newInteger(2));
    assert(dict.getKeys().size() == 2);
    assert(dict.getKey("/Count").getIntValue() == 2);
    dict.removeKey("/Count");
    assert(!dict.hasKey("/Count"));

    auto copy = dict.shallowCopy();
    copy.replaceKey("/Extra", DPDFObjectHandle::newBool(true));
    assert(!dict.hasKey("/Extra"));

    auto arr = DPDFObjectHandle::newArray();
    arr.appendItem(DPDFObjectHandle::newInteger(1));
    arr.appendItem(DPDFObjectHandle::newReference(4, 0));
    arr.setArrayItem(0, DPDFObjectHandle::newReal("2.5"));
    assert(arr.unparse() == "[ 2.5 4 0 R ]");
    arr.eraseItem(0);
    assert(arr.getArrayNItems() == 1);

    try {
        arr.setArrayItem(5, DPDFObjectHandle::newNull());
        assert(false);
    } catch (std::logic_error&) {
    }
    try {
        DPDFObjectHandle::newInteger(1).getName();
        assert(false);
    } catch (std::logic_error& e) {
        std::cout << "logic error: " << e.what() << '\n';
    }
    try {
        DPDFObjectHandle::newReference(0, 0);
        assert(false);
    } catch (std::logic_error&) {
    }

    auto stream = DPDFObjectHandle::newStream(DPDFObjectHandle::newDictionary(), "data");
    assert(stream.getDict().getKey("/Length").getIntValue() == 4);
    stream.replaceStreamData("longer data");
    assert(stream.getDict().getKey("/Length").getIntValue() == 11);
    assert(stream.getStreamData() == "longer data");
    assert(
        stream.unparseResolved() == "<< /Length 11 >>\nstream\nlonger data\nendstream");

    assert(DPDFObjectHandle::newNull().getTypeName() == std::string("null"));
    assert(!DPDFObjectHandle().isInitialized());
}

int
main()
{
    test_scalars();
    test_containers();
    test_round_trip();
    test_streams();
    test_errors();
    test_exceptions();
    test_handle_api();
    std::cout << "parser tests done" << '\n';
    return 0;
}
