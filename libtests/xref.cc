#include <deltapdf/assert_test.h>

// This program tests reading cross-reference tables and streams, following /Prev chains, and
// recovering from damaged cross-reference data.

#include "pdf_builder.hh"

#include <deltapdf/DPDF.hh>
#include <deltapdf/DPDFExc.hh>
#include <deltapdf/DPDFObjectHandle.hh>

#include <iostream>

static std::string const catalog_with_direct_page =
    "<< /Type /Catalog /Pages << /Type /Pages /Count 1 /Kids [ << /Type /Page /MediaBox "
    "[ 0 0 612 792 ] >> ] >> >>";

static void
test_single_table()
{
    PDFBuilder b;
    b.addObject(1, catalog_with_direct_page);
    b.finish(b.addXrefTable("<< /Size 2 /Root 1 0 R >>"));

    auto pdf = open_pdf(b.data);
    auto const& xref = pdf->getXRefTable();
    assert(xref.size() == 2);
    assert(xref.at(0).isFree());
    assert(xref.at(1).getType() == 1);
    assert(xref.at(1).getOffset() == 9);
    assert(xref.at(1).getGeneration() == 0);
    assert(pdf->getPDFVersion() == "1.7");
    assert(pdf->getTrailers().size() == 1);
    assert(pdf->getXRefSectionOffsets().size() == 1);
    assert(pdf->getXRefSectionOffsets().at(0) == pdf->getStartXRef());
    assert(pdf->getPageCount() == 1);
    assert(pdf->getRoot().isDictionaryOfType("/Catalog"));
    assert(pdf->getWarnings().empty());

    // Free, missing and mismatched generation references are null
    assert(pdf->getObject(0, 65535).isNull());
    assert(pdf->getObject(7, 0).isNull());
    assert(pdf->getObject(1, 1).isNull());
}

static void
test_xref_stream()
{
    PDFBuilder b;
    add_basic_pages(b);
    auto objstm_offset = b.addObjectStream(
        50, {{10, "(a)"}, {11, "(b)"}, {12, "(c)"}, {13, "(fourth)"}});
    std::vector<PDFBuilder::Entry> entries = {
        {0, 0, 0, 0},
        {1, 1, 9, 0},
        {50, 1, objstm_offset, 0},
    };
    auto const& data = b.data;
    entries[1].f1 = static_cast<long long>(data.find("1 0 obj"));
    entries.push_back({2, 1, static_cast<long long>(data.find("2 0 obj")), 0});
    entries.push_back({3, 1, static_cast<long long>(data.find("3 0 obj")), 0});
    for (int i = 0; i < 4; ++i) {
        entries.push_back({10 + i, 2, 50, i});
    }
    b.finish(b.addXrefStream(60, entries, "/Root 1 0 R"));

    auto pdf = open_pdf(b.data);
    auto const& xref = pdf->getXRefTable();
    assert(xref.size() == 10);
    assert(xref.at(13).getType() == 2);
    assert(xref.at(13).getObjStreamNumber() == 50);
    assert(xref.at(13).getObjStreamIndex() == 3);
    assert(pdf->getObject(13, 0).getStringValue() == "fourth");
    assert(pdf->getObject(10, 0).getStringValue() == "a");
    // Objects in object streams always have generation 0
    assert(pdf->getObject(13, 1).isNull());
    assert(pdf->getPageCount() == 1);
    assert(pdf->getTrailer().getKey("/Type").getName() == "/XRef");
    assert(pdf->getTrailers().size() == 1);
    assert(pdf->getWarnings().empty());
}

static void
test_table_and_stream_agree()
{
    // The same objects described once by a table and once by a stream
    PDFBuilder t;
    add_basic_pages(t);
    auto body = t.data;
    t.finish(t.addXrefTable("<< /Size 4 /Root 1 0 R >>"));

    PDFBuilder s;
    s.data = body;
    std::vector<PDFBuilder::Entry> entries = {{0, 0, 0, 0}};
    for (int i = 1; i <= 3; ++i) {
        entries.push_back(
            {i, 1, static_cast<long long>(body.find(std::to_string(i) + " 0 obj")), 0});
    }
    s.finish(s.addXrefStream(4, entries, "/Root 1 0 R"));

    auto from_table = open_pdf(t.data);
    auto from_stream = open_pdf(s.data);
    auto const& xt = from_table->getXRefTable();
    auto const& xs = from_stream->getXRefTable();
    assert(xt.size() == 4);
    assert(xs.size() == 5);
    for (auto const& [obj, entry]: xt) {
        assert(xs.at(obj) == entry);
    }
    assert(
        from_table->getObject(3, 0).unparseResolved() ==
        from_stream->getObject(3, 0).unparseResolved());
}

static void
test_hybrid()
{
    PDFBuilder b;
    add_basic_pages(b);
    b.addObjectStream(50, {{10, "(compressed)"}, {11, "<< /K 42 >>"}});
    auto stm_offset = b.addXrefStream(60, {{10, 2, 50, 0}, {11, 2, 50, 1}});
    auto table_offset = b.addXrefTable(
        "<< /Size 61 /Root 1 0 R /XRefStm " + std::to_string(stm_offset) + " >>");
    b.finish(table_offset);

    auto pdf = open_pdf(b.data);
    auto const& xref = pdf->getXRefTable();
    assert(xref.at(50).getType() == 1);
    assert(xref.at(10).getType() == 2);
    assert(pdf->getObject(10, 0).getStringValue() == "compressed");
    assert(pdf->getObject(11, 0).getKey("/K").getIntValue() == 42);
    // Only the table is a section of its own
    assert(pdf->getTrailers().size() == 1);
    assert(pdf->getXRefSectionOffsets().at(0) == table_offset);
    assert(pdf->getWarnings().empty());
}

static void
test_prev_chain()
{
    PDFBuilder b;
    add_basic_pages(b);
    auto first = b.addXrefTable("<< /Size 4 /Root 1 0 R >>");
    b.finish(first);
    b.addObject(3, "<< /Type /Page /Parent 2 0 R /MediaBox [ 0 0 100 100 ] >>");
    b.addObject(4, "(added)");
    auto second =
        b.addXrefTable("<< /Size 5 /Root 1 0 R /Prev " + std::to_string(first) + " >>", false);
    b.finish(second);

    auto pdf = open_pdf(b.data);
    assert(pdf->getStartXRef() == second);
    auto offsets = pdf->getXRefSectionOffsets();
    assert(offsets.size() == 2);
    assert(offsets.at(0) == second);
    assert(offsets.at(1) == first);
    auto trailers = pdf->getTrailers();
    assert(trailers.size() == 2);
    assert(trailers.at(0).getKey("/Prev").getIntValue() == first);
    assert(!trailers.at(1).hasKey("/Prev"));
    // The newest trailer is the document's trailer
    assert(pdf->getTrailer().getKey("/Size").getIntValue() == 5);

    auto const& xref = pdf->getXRefTable();
    assert(xref.at(3).getOffset() == static_cast<dpdf_offset_t>(b.data.rfind("3 0 obj")));
    auto page = pdf->getObject(3, 0);
    assert(page.getKey("/MediaBox").getArrayItem(2).getIntValue() == 100);
    assert(pdf->getObject(4, 0).getStringValue() == "added");
    assert(pdf->getNextObjectId() == 5);

    // An update written as a stream on top of a table
    PDFBuilder m;
    add_basic_pages(m);
    auto base = m.addXrefTable("<< /Size 4 /Root 1 0 R >>");
    m.finish(base);
    auto off4 = m.addObject(4, "(from stream section)");
    m.finish(m.addXrefStream(
        5, {{4, 1, off4, 0}}, "/Root 1 0 R /Prev " + std::to_string(base)));
    auto mixed = open_pdf(m.data);
    assert(mixed->getTrailers().size() == 2);
    assert(mixed->getObject(4, 0).getStringValue() == "from stream section");
    assert(mixed->getPageCount() == 1);
}

static void
test_loops()
{
    PDFBuilder b;
    b.addObject(1, catalog_with_direct_page);
    auto self = static_cast<dpdf_offset_t>(b.data.size());
    b.finish(b.addXrefTable("<< /Size 2 /Root 1 0 R /Prev " + std::to_string(self) + " >>"));
    assert(open_error(b.data) == dpdf_e_invalid_xref);

    // Recovery rebuilds the table from the objects in the file
    auto pdf = open_pdf(b.data, true);
    assert(pdf->getPageCount() == 1);
    auto warnings = pdf->getWarnings();
    assert(has_warning(warnings, "file is damaged"));
    assert(has_warning(warnings, "loop detected following xref tables"));

    // Two sections pointing at each other
    PDFBuilder c;
    c.addObject(1, catalog_with_direct_page);
    auto a_offset = static_cast<dpdf_offset_t>(c.data.size());
    // The first section's /Prev is patched once the second section's offset is known
    c.addXrefTable("<< /Size 2 /Root 1 0 R /Prev 0000000000 >>");
    c.finish(a_offset);
    auto b_offset = static_cast<dpdf_offset_t>(c.data.size());
    c.addXrefTable("<< /Size 2 /Root 1 0 R /Prev " + std::to_string(a_offset) + " >>");
    c.finish(b_offset);
    auto prev_at = c.data.find("/Prev 0000000000");
    auto b_str = std::to_string(b_offset);
    c.data.replace(prev_at + 6 + (10 - b_str.size()), b_str.size(), b_str);
    assert(open_error(c.data) == dpdf_e_invalid_xref);
}

static void
test_bad_entries()
{
    PDFBuilder b;
    b.addObject(1, catalog_with_direct_page);
    auto xref = static_cast<dpdf_offset_t>(b.data.size());
    b.data += "xref\n0 2\n0000000000 65535 f \nxx00000009 00000 n \n"
              "trailer\n<< /Size 2 /Root 1 0 R >>\n";
    b.finish(xref);
    assert(open_error(b.data) == dpdf_e_invalid_xref);
    assert(open_pdf(b.data, true)->getPageCount() == 1);

    // A 19-byte entry with a single-character line end is accepted quietly
    PDFBuilder s;
    s.addObject(1, catalog_with_direct_page);
    xref = static_cast<dpdf_offset_t>(s.data.size());
    s.data += "xref\n0 2\n0000000000 65535 f \n0000000009 00000 n\n"
              "trailer\n<< /Size 2 /Root 1 0 R >>\n";
    s.finish(xref);
    auto pdf = open_pdf(s.data);
    assert(pdf->getXRefTable().at(1).getOffset() == 9);
    assert(pdf->getWarnings().empty());

    // Extra spaces are accepted with a warning
    PDFBuilder w;
    w.addObject(1, catalog_with_direct_page);
    xref = static_cast<dpdf_offset_t>(w.data.size());
    w.data += "xref\n0 2\n0000000000 65535 f \n0000000009  00000 n\n"
              "trailer\n<< /Size 2 /Root 1 0 R >>\n";
    w.finish(xref);
    pdf = open_pdf(w.data);
    assert(pdf->getPageCount() == 1);
    assert(has_warning(pdf->getWarnings(), "accepting invalid xref table entry"));

    // Whitespace between the startxref offset and the xref keyword
    PDFBuilder ws;
    ws.addObject(1, catalog_with_direct_page);
    xref = static_cast<dpdf_offset_t>(ws.data.size());
    ws.data += "\n\n";
    ws.addXrefTable("<< /Size 2 /Root 1 0 R >>");
    ws.finish(xref);
    pdf = open_pdf(ws.data);
    assert(pdf->getPageCount() == 1);
    assert(has_warning(pdf->getWarnings(), "extraneous whitespace seen before xref"));

    // /Size that doesn't match the table
    PDFBuilder sz;
    sz.addObject(1, catalog_with_direct_page);
    sz.finish(sz.addXrefTable("<< /Size 10 /Root 1 0 R >>"));
    pdf = open_pdf(sz.data);
    assert(has_warning(pdf->getWarnings(), "reported number of objects (10)"));

    PDFBuilder nosize;
    nosize.addObject(1, catalog_with_direct_page);
    nosize.finish(nosize.addXrefTable("<< /Root 1 0 R >>"));
    assert(open_error(nosize.data) == dpdf_e_invalid_xref);
}

static void
test_bad_startxref()
{
    PDFBuilder b;
    b.addObject(1, catalog_with_direct_page);
    b.addXrefTable("<< /Size 2 /Root 1 0 R >>");
    auto good = b.data;
    b.finish(3);
    assert(open_error(b.data) == dpdf_e_invalid_xref);
    auto pdf = open_pdf(b.data, true);
    assert(pdf->getPageCount() == 1);
    assert(pdf->getTrailer().getKey("/Root").getRefObjGen() == DPDFObjGen(1, 0));

    // No startxref at all
    assert(open_error(good) == dpdf_e_invalid_xref);
    assert(open_error(good, true) == dpdf_e_success);
}

static void
test_bad_xref_streams()
{
    auto with_stream = [](std::string const& keys, std::string const& bin) {
        PDFBuilder b;
        b.addObject(1, catalog_with_direct_page);
        auto offset = static_cast<dpdf_offset_t>(b.data.size());
        b.data += "2 0 obj\n<< /Type /XRef /Root 1 0 R " + keys + " /Length " +
            std::to_string(bin.size()) + " >>\nstream\n" + bin + "\nendstream\nendobj\n";
        b.finish(offset);
        return b.data;
    };
    std::string three_entries("\0\0\0\0\1\0\x09\0\1\0\x40\0", 12);

    assert(open_error(with_stream("/Size 3 /W [ 1 2 1 ]", three_entries)) == dpdf_e_success);
    assert(open_error(with_stream("/Size 3 /W [ 1 2 ]", three_entries)) == dpdf_e_invalid_xref);
    assert(open_error(with_stream("/Size 3 /W [ 1 9 1 ]", three_entries)) == dpdf_e_invalid_xref);
    assert(open_error(with_stream("/Size 3 /W [ 0 0 0 ]", three_entries)) == dpdf_e_invalid_xref);
    assert(
        open_error(with_stream("/Size 3 /W [ 1 -2 1 ]", three_entries)) == dpdf_e_invalid_xref);
    // Wrong amount of data for /Size
    assert(open_error(with_stream("/Size 4 /W [ 1 2 1 ]", three_entries)) == dpdf_e_invalid_xref);
    assert(
        open_error(with_stream("/Size 3 /W [ 1 2 1 ] /Index [ 0 -3 ]", three_entries)) ==
        dpdf_e_invalid_xref);
    assert(
        open_error(with_stream("/Size 3 /W [ 1 2 1 ] /Index [ 0 ]", three_entries)) ==
        dpdf_e_invalid_xref);
    std::string bad_type("\0\0\0\0\3\0\x09\0\1\0\x40\0", 12);
    assert(open_error(with_stream("/Size 3 /W [ 1 2 1 ]", bad_type)) == dpdf_e_invalid_xref);

    // Without a trailer keyword, recovery finds the catalog among the objects
    auto pdf = open_pdf(with_stream("/Size 3 /W [ 1 2 ]", three_entries), true);
    assert(pdf->getPageCount() == 1);
    assert(has_warning(pdf->getWarnings(), "using the document catalog"));
    assert(pdf->getTrailer().getKey("/Size").getIntValue() == 3);
}

static void
test_deferred_length()
{
    PDFBuilder b;
    add_basic_pages(b);
    std::vector<PDFBuilder::Entry> entries = {{0, 0, 0, 0}};
    for (int i = 1; i <= 3; ++i) {
        entries.push_back(
            {i, 1, static_cast<long long>(b.data.find(std::to_string(i) + " 0 obj")), 0});
    }
    // The stream's /Length lives in an object that comes after it
    auto good = b;
    good.finish(good.addXrefStream(4, entries, "/Root 1 0 R", 5));
    auto pdf = open_pdf(good.data);
    assert(pdf->getObject(5, 0).getIntValue() == 24);
    assert(pdf->getPageCount() == 1);
    assert(pdf->getWarnings().empty());

    // A length that disagrees with the data
    auto bad = b;
    bad.finish(bad.addXrefStream(4, entries, "/Root 1 0 R", 5));
    auto pos = bad.data.find("5 0 obj\n24\n");
    assert(pos != std::string::npos);
    bad.data.replace(pos + 8, 2, "19");
    assert(open_error(bad.data) == dpdf_e_corrupted);
    pdf = open_pdf(bad.data, true);
    assert(pdf->getPageCount() == 1);
    assert(has_warning(pdf->getWarnings(), "does not match the data found before endstream"));
}

int
main()
{
    test_single_table();
    test_xref_stream();
    test_table_and_stream_agree();
    test_hybrid();
    test_prev_chain();
    test_loops();
    test_bad_entries();
    test_bad_startxref();
    test_bad_xref_streams();
    test_deferred_length();
    std::cout << "xref tests done" << '\n';
    return 0;
}
