#include <deltapdf/assert_test.h>

// This program tests the document model: resolving references, walking the page tree, object
// streams, and recovering objects whose cross-reference entries are wrong.

#include "pdf_builder.hh"

#include <deltapdf/DPDF.hh>
#include <deltapdf/DPDFExc.hh>
#include <deltapdf/DPDFObjectHandle.hh>
#include <deltapdf/DUtil.hh>

#include <cstdio>
#include <iostream>
#include <stdexcept>

static std::string
page_tree_file()
{
    PDFBuilder b;
    b.addObject(1, "<< /Type /Catalog /Pages 2 0 R >>");
    b.addObject(
        2,
        "<< /Type /Pages /Kids [ 3 0 R 4 0 R ] /Count 3 /MediaBox [ 0 0 612 792 ] "
        "/Resources << /Font << >> >> /Rotate 90 >>");
    b.addObject(3, "<< /Type /Page /Parent 2 0 R /Rotate 0 >>");
    b.addObject(
        4, "<< /Type /Pages /Parent 2 0 R /Kids [ 5 0 R 6 0 R ] /Count 2 /MediaBox 8 0 R >>");
    b.addObject(5, "<< /Type /Page /Parent 4 0 R >>");
    b.addObject(6, "<< /Type /Page /Parent 4 0 R /MediaBox [ 0 0 50 50 ] >>");
    b.addObject(7, "<< /Title (Page tree test) >>");
    b.addObject(8, "[ 0 0 100 100 ]");
    b.finish(b.addXrefTable("<< /Size 9 /Root 1 0 R /Info 7 0 R >>"));
    return b.data;
}

static void
test_pages()
{
    auto pdf = open_pdf(page_tree_file());
    auto pages = pdf->getAllPages();
    assert(pages.size() == 3);
    assert(pdf->getPageCount() == 3);
    assert(pages.at(0).getObjGen() == DPDFObjGen(3, 0));
    assert(pages.at(1).getObjGen() == DPDFObjGen(5, 0));
    assert(pages.at(2).getObjGen() == DPDFObjGen(6, 0));

    // A page's own value wins over an inherited one
    assert(pages.at(0).getKey("/Rotate").getIntValue() == 0);
    assert(pages.at(0).getKey("/MediaBox").getArrayItem(2).getIntValue() == 612);
    // The nearest ancestor wins
    auto mb = pdf->resolve(pages.at(1).getKey("/MediaBox"));
    assert(mb.getArrayItem(2).getIntValue() == 100);
    assert(pages.at(1).getKey("/Rotate").getIntValue() == 90);
    assert(pages.at(1).getKey("/Resources").isDictionary());
    assert(pages.at(2).getKey("/MediaBox").getArrayItem(2).getIntValue() == 50);

    // Inheritance doesn't change the page objects themselves
    assert(!pdf->getObject(5, 0).hasKey("/MediaBox"));

    auto info = pdf->getInfo();
    assert(info.getKey("/Title").getStringValue() == "Page tree test");
    assert(pdf->getCatalog().isDictionaryOfType("/Catalog"));
    assert(pdf->getRootReference().getRefObjGen() == DPDFObjGen(1, 0));
    assert(pdf->getNextObjectId() == 9);
    assert(!pdf->isEncrypted());
    assert(!pdf->isLinearized());
}

static void
test_bad_page_trees()
{
    PDFBuilder b;
    b.addObject(1, "<< /Type /Catalog /Pages 2 0 R >>");
    b.addObject(2, "<< /Type /Pages /Kids [ 3 0 R ] /Count 1 >>");
    b.addObject(3, "<< /Type /Pages /Kids [ 2 0 R ] /Count 1 >>");
    b.finish(b.addXrefTable("<< /Size 4 /Root 1 0 R >>"));
    for (bool recover: {false, true}) {
        auto pdf = open_pdf(b.data, recover);
        try {
            pdf->getAllPages();
            assert(false);
        } catch (DPDFExc& e) {
            std::cout << "page tree error: " << e.what() << '\n';
            assert(e.getErrorCode() == dpdf_e_invalid_object);
            assert(e.getMessageDetail() == "loop detected in pages tree");
        }
    }

    // The same page twice is not a loop
    PDFBuilder twice;
    twice.addObject(1, "<< /Type /Catalog /Pages 2 0 R >>");
    twice.addObject(2, "<< /Type /Pages /Kids [ 3 0 R 3 0 R ] /Count 2 >>");
    twice.addObject(3, "<< /Type /Page /Parent 2 0 R >>");
    twice.finish(twice.addXrefTable("<< /Size 4 /Root 1 0 R >>"));
    assert(open_pdf(twice.data)->getPageCount() == 2);

    // A kid that isn't a dictionary is skipped with a warning only during recovery
    PDFBuilder bad_kid;
    bad_kid.addObject(1, "<< /Type /Catalog /Pages 2 0 R >>");
    bad_kid.addObject(2, "<< /Type /Pages /Kids [ 3 0 R 42 ] /Count 2 >>");
    bad_kid.addObject(3, "<< /Type /Page /Parent 2 0 R >>");
    bad_kid.finish(bad_kid.addXrefTable("<< /Size 4 /Root 1 0 R >>"));
    try {
        open_pdf(bad_kid.data)->getAllPages();
        assert(false);
    } catch (DPDFExc& e) {
        assert(e.getErrorCode() == dpdf_e_invalid_object);
    }
    auto pdf = open_pdf(bad_kid.data, true);
    assert(pdf->getPageCount() == 1);
    assert(has_warning(pdf->getWarnings(), "/Kids contains a integer"));

    PDFBuilder no_pages;
    no_pages.addObject(1, "<< /Type /Catalog >>");
    no_pages.finish(no_pages.addXrefTable("<< /Size 2 /Root 1 0 R >>"));
    try {
        open_pdf(no_pages.data)->getAllPages();
        assert(false);
    } catch (DPDFExc& e) {
        assert(e.getErrorCode() == dpdf_e_invalid_object);
    }
}

static void
test_resolve()
{
    PDFBuilder b;
    add_basic_pages(b);
    b.addObject(4, "5 0 R");
    b.addObject(5, "4 0 R");
    b.addObject(6, "<< /Self 6 0 R >>");
    b.addObject(7, "<< /Title (shared) >>");
    b.addObject(8, "[ 7 0 R 7 0 R << /Deeper 9 0 R >> ]");
    b.addObject(9, "10 0 R");
    b.addObject(10, "(end of chain)");
    b.finish(b.addXrefTable("<< /Size 11 /Root 1 0 R >>"));
    auto pdf = open_pdf(b.data);

    try {
        pdf->resolve(DPDFObjectHandle::newReference(4, 0));
        assert(false);
    } catch (DPDFExc& e) {
        std::cout << "resolve error: " << e.what() << '\n';
        assert(e.getErrorCode() == dpdf_e_invalid_object);
    }
    try {
        pdf->resolveAll(pdf->getObject(6, 0));
        assert(false);
    } catch (DPDFExc& e) {
        std::cout << "resolveAll error: " << e.what() << '\n';
        assert(e.getErrorCode() == dpdf_e_invalid_object);
    }

    // Resolving a chain of references
    assert(pdf->resolve(DPDFObjectHandle::newReference(9, 0)).getStringValue() == "end of chain");
    // Objects that appear more than once aren't cycles
    auto all = pdf->resolveAll(DPDFObjectHandle::newReference(8, 0));
    assert(all.unparse() ==
           "[ << /Title (shared) >> << /Title (shared) >> << /Deeper (end of chain) >> ]");
    // resolveAll returns a copy
    all.getArrayItem(0).replaceKey("/Title", DPDFObjectHandle::newString("changed"));
    assert(pdf->getObject(7, 0).getKey("/Title").getStringValue() == "shared");

    // Missing objects resolve to null
    assert(pdf->resolve(DPDFObjectHandle::newReference(99, 0)).isNull());
    // Direct objects resolve to themselves
    assert(pdf->resolve(DPDFObjectHandle::newInteger(3)).getIntValue() == 3);

    // Objects are cached, so changes to a handle are seen through later lookups
    pdf->getObject(3, 0).replaceKey("/Marked", DPDFObjectHandle::newBool(true));
    assert(pdf->getObject(3, 0).getKey("/Marked").getBoolValue());
    assert(pdf->getObject(3, 0).getObjGen() == DPDFObjGen(3, 0));

    // A shallow copy can be changed without touching the cached object
    auto copy = pdf->getObject(3, 0).shallowCopy();
    copy.replaceKey("/Marked", DPDFObjectHandle::newBool(false));
    copy.replaceKey("/Extra", DPDFObjectHandle::newInteger(1));
    assert(pdf->getObject(3, 0).getKey("/Marked").getBoolValue());
    assert(!pdf->getObject(3, 0).hasKey("/Extra"));
    assert(!copy.isIndirect());
}

static void
test_streams()
{
    PDFBuilder b;
    add_basic_pages(b);
    b.addObject(4, "<< /Length 5 0 R /Filter 6 0 R >>\nstream\n68656c6c6f>\nendstream");
    b.addObject(5, "11");
    b.addObject(6, "/ASCIIHexDecode");
    b.addObject(7, "<< /Length 8 0 R >>\nstream\nabc\nendstream");
    b.addObject(8, "(not a number)");
    b.finish(b.addXrefTable("<< /Size 9 /Root 1 0 R >>"));
    auto pdf = open_pdf(b.data);

    auto stream = pdf->getObject(4, 0);
    assert(stream.isStream());
    assert(stream.getRawStreamData() == "68656c6c6f>");
    assert(pdf->getStreamData(stream) == "hello");
    assert(pdf->getStreamData(DPDFObjectHandle::newReference(4, 0)) == "hello");
    // Decoding is done once
    assert(stream.getStreamData() == "hello");

    try {
        pdf->getObject(7, 0);
        assert(false);
    } catch (DPDFExc& e) {
        assert(e.getErrorCode() == dpdf_e_invalid_object);
    }
    try {
        pdf->getStreamData(pdf->getObject(5, 0));
        assert(false);
    } catch (std::logic_error& e) {
        std::cout << "logic error: " << e.what() << '\n';
    }
}

static void
test_page_content()
{
    PDFBuilder b;
    b.addObject(1, "<< /Type /Catalog /Pages 2 0 R >>");
    b.addObject(2, "<< /Type /Pages /Kids [ 3 0 R 4 0 R 5 0 R ] /Count 3 >>");
    b.addObject(3, "<< /Type /Page /Parent 2 0 R /Contents 6 0 R >>");
    b.addObject(4, "<< /Type /Page /Parent 2 0 R /Contents [ 7 0 R 8 0 R 6 0 R ] >>");
    b.addObject(5, "<< /Type /Page /Parent 2 0 R >>");
    b.addObject(6, "<< /Length 12 >>\nstream\nBT (a) Tj ET\nendstream");
    b.addObject(
        7, "<< /Length 15 /Filter /ASCIIHexDecode >>\nstream\n3020302030206d>\nendstream");
    b.addObject(8, "(not a stream)");
    b.finish(b.addXrefTable("<< /Size 9 /Root 1 0 R >>"));
    auto pdf = open_pdf(b.data);

    assert(pdf->getPage(0).getObjGen() == DPDFObjGen(3, 0));
    assert(pdf->getPage(2).getObjGen() == DPDFObjGen(5, 0));
    assert(pdf->getPage(3).isNull());
    assert(pdf->getPage(-1).isNull());

    assert(pdf->getPageContent(0) == "BT (a) Tj ET");
    // Each stream of an array is followed by a newline
    assert(pdf->getPageContent(1) == "0 0 0 m\nBT (a) Tj ET\n");
    assert(pdf->getPageContent(2).empty());
    assert(pdf->getPageContent(3).empty());
}

static void
test_object_streams()
{
    PDFBuilder b;
    auto off1 = b.addObject(1, "<< /Type /Catalog /Pages 2 0 R >>");
    // The entries for 10 and 11 have their indexes swapped. Object 12 isn't in the stream.
    auto off50 = b.addObjectStream(
        50,
        {{10, "(ten)"},
         {11, "(eleven)"},
         {2, "<< /Type /Pages /Kids [ 3 0 R ] /Count 1 >>"},
         {3, "<< /Type /Page /Parent 2 0 R >>"}});
    b.finish(b.addXrefStream(
        60,
        {{0, 0, 0, 0},
         {1, 1, off1, 0},
         {2, 2, 50, 2},
         {3, 2, 50, 3},
         {10, 2, 50, 1},
         {11, 2, 50, 0},
         {12, 2, 50, 4},
         {50, 1, off50, 0}},
        "/Root 1 0 R"));
    auto pdf = open_pdf(b.data);
    assert(pdf->getObject(10, 0).getStringValue() == "ten");
    assert(pdf->getObject(11, 0).getStringValue() == "eleven");
    assert(pdf->getObject(11, 0).getObjGen() == DPDFObjGen(11, 0));
    assert(pdf->getPageCount() == 1);
    try {
        pdf->getObject(12, 0);
        assert(false);
    } catch (DPDFExc& e) {
        std::cout << "object stream error: " << e.what() << '\n';
        assert(e.getErrorCode() == dpdf_e_invalid_object);
    }

    // An object stream entry that points at something other than a stream
    PDFBuilder n;
    auto noff1 = n.addObject(1, "<< /Type /Catalog /Pages << /Type /Pages /Kids [ ] >> >>");
    auto noff2 = n.addObject(2, "(not a stream)");
    n.finish(n.addXrefStream(
        60, {{0, 0, 0, 0}, {1, 1, noff1, 0}, {2, 1, noff2, 0}, {3, 2, 2, 0}}, "/Root 1 0 R"));
    try {
        open_pdf(n.data)->getObject(3, 0);
        assert(false);
    } catch (DPDFExc& e) {
        assert(e.getErrorCode() == dpdf_e_invalid_object);
    }
}

static void
test_object_recovery()
{
    // The table sends object 3 to object 2's offset
    PDFBuilder b;
    b.addObject(1, "<< /Type /Catalog /Pages 2 0 R >>");
    auto off2 = b.addObject(2, "<< /Type /Pages /Kids [ 3 0 R ] /Count 1 >>");
    auto off3 = b.addObject(3, "<< /Type /Page /Parent 2 0 R >>");
    b.finish(b.addXrefTable("<< /Size 4 /Root 1 0 R >>"));
    auto entry3 = DUtil::int_to_string(off3, 10) + " 00000 n";
    auto pos = b.data.find(entry3);
    assert(pos != std::string::npos);
    b.data.replace(pos, 10, DUtil::int_to_string(off2, 10));

    auto strict = open_pdf(b.data);
    try {
        strict->getObject(3, 0);
        assert(false);
    } catch (DPDFExc& e) {
        std::cout << "strict error: " << e.what() << '\n';
        assert(e.getErrorCode() == dpdf_e_invalid_object);
    }

    auto pdf = open_pdf(b.data, true);
    assert(pdf->getObject(3, 0).isDictionaryOfType("/Page"));
    assert(pdf->getXRefTable().at(3).getOffset() == off3);
    assert(pdf->getPageCount() == 1);
    auto warnings = pdf->getWarnings();
    assert(has_warning(warnings, "file is damaged"));
    assert(has_warning(warnings, "expected 3 0 obj but found 2 0 obj"));
    // The trailer read from the file is kept
    assert(pdf->getTrailers().size() == 1);

    // Nothing to recover
    assert(open_error("%PDF-1.7\nnot much here\n", true) == dpdf_e_invalid_xref);
    assert(open_error("%PDF-1.7\n1 0 obj\n(x)\nendobj\n", true) == dpdf_e_invalid_xref);
}

static void
test_file_properties()
{
    PDFBuilder lin("%PDF-1.4\n");
    lin.addObject(10, "<< /Linearized 1 /L 1000 >>");
    add_basic_pages(lin);
    lin.addObject(4, "<< /Title (info) >>");
    lin.addObject(5, "<< /Filter /Standard >>");
    lin.finish(lin.addXrefTable("<< /Size 11 /Root 1 0 R /Info 4 0 R /Encrypt 5 0 R >>"));
    auto pdf = open_pdf(lin.data);
    assert(pdf->getPDFVersion() == "1.4");
    assert(pdf->isLinearized());
    assert(pdf->isEncrypted());
    assert(pdf->getInfo().getKey("/Title").getStringValue() == "info");
    assert(pdf->getFilename() == "test.pdf");
    assert(pdf->getBuffer()->size() == lin.data.size());

    // No header
    PDFBuilder nh("not a header\n");
    nh.addObject(1, "<< /Type /Catalog /Pages << /Type /Pages /Kids [ ] >> >>");
    nh.finish(nh.addXrefTable("<< /Size 2 /Root 1 0 R >>"));
    pdf = open_pdf(nh.data);
    assert(pdf->getPDFVersion() == "1.2");
    assert(has_warning(pdf->getWarnings(), "can't find PDF header"));
    assert(pdf->getPageCount() == 0);
    assert(pdf->getInfo().isNull());

    PDFBuilder bad_root;
    bad_root.addObject(1, "42");
    bad_root.finish(bad_root.addXrefTable("<< /Size 2 /Root 1 0 R >>"));
    try {
        open_pdf(bad_root.data)->getRoot();
        assert(false);
    } catch (DPDFExc& e) {
        assert(e.getErrorCode() == dpdf_e_invalid_object);
    }
}

static void
test_process()
{
    DPDF pdf;
    try {
        pdf.getTrailer();
        assert(false);
    } catch (std::logic_error& e) {
        std::cout << "logic error: " << e.what() << '\n';
    }

    try {
        pdf.processFile("no-such-file.pdf");
        assert(false);
    } catch (DPDFExc& e) {
        std::cout << "missing file: " << e.what() << '\n';
        assert(e.getErrorCode() == dpdf_e_system);
        assert(e.getFilename() == "no-such-file.pdf");
    }

    DUtil::write_string_to_file("document-test.pdf", page_tree_file());
    DPDF from_file;
    from_file.processFile("document-test.pdf");
    assert(from_file.getFilename() == "document-test.pdf");
    assert(from_file.getPageCount() == 3);
    try {
        from_file.processFile("document-test.pdf");
        assert(false);
    } catch (std::logic_error& e) {
        std::cout << "logic error: " << e.what() << '\n';
    }
    std::remove("document-test.pdf");
}

int
main()
{
    test_pages();
    test_bad_page_trees();
    test_resolve();
    test_streams();
    test_page_content();
    test_object_streams();
    test_object_recovery();
    test_file_properties();
    test_process();
    std::cout << "document tests done" << '\n';
    return 0;
}
