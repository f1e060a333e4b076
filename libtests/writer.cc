#include <deltapdf/assert_test.h>

// This program tests writing complete documents with DPDFWriter and reading them back

#include "pdf_builder.hh"

#include <deltapdf/DPDF.hh>
#include <deltapdf/DPDFObjectHandle.hh>
#include <deltapdf/DPDFWriter.hh>
#include <deltapdf/DUtil.hh>
#include <deltapdf/Pl_Flate.hh>

#include <cstdio>
#include <iostream>
#include <stdexcept>

static bool
starts_with(std::string const& str, std::string const& prefix)
{
    return str.compare(0, prefix.size(), prefix) == 0;
}

static bool
contains(std::string const& str, std::string const& part)
{
    return str.find(part) != std::string::npos;
}

// A catalog and a one-page tree whose page has the given content stream
static void
add_page_with_content(DPDFWriter& w, DPDFObjectHandle const& content)
{
    auto content_ref = w.addObject(content);
    auto page = DPDFObjectHandle::newDictionary();
    page.replaceKey("/Type", DPDFObjectHandle::newName("/Page"));
    page.replaceKey("/Contents", content_ref);
    auto page_ref = w.addObject(page);
    auto pages = DPDFObjectHandle::parse("<< /Type /Pages /Count 1 >>");
    pages.replaceKey("/Kids", DPDFObjectHandle::newArray({page_ref}));
    auto pages_ref = w.addObject(pages);
    page.replaceKey("/Parent", pages_ref);
    auto catalog = DPDFObjectHandle::newDictionary();
    catalog.replaceKey("/Pages", pages_ref);
    w.setCatalog(catalog);
}

static DPDFObjectHandle
content_stream(std::string const& data, char const* dict = "<< >>")
{
    return DPDFObjectHandle::newStream(DPDFObjectHandle::parse(dict), data);
}

static void
test_minimal_table()
{
    auto w = DPDFWriter::createMinimalDocument();
    assert(w->getVersion() == "1.7");
    assert(w->getNextObjectId() == 5);
    assert(w->getObject(1).isDictionaryOfType("/Page"));
    assert(w->getObject(2).isDictionaryOfType("/Pages"));
    assert(w->getObject(3).isDictionaryOfType("/Catalog"));
    assert(w->getObject(5).isNull());

    auto out = w->write();
    assert(starts_with(out, "%PDF-1.7\n%\xe2\xe3\xcf\xd3\n"));
    assert(out.substr(out.size() - 6) == "%%EOF\n");
    auto xref_pos = out.rfind("\nxref\n") + 1;
    assert(contains(out, "startxref\n" + std::to_string(xref_pos) + "\n%%EOF\n"));
    // Object 0 heads the free list and all objects share one subsection
    assert(out.substr(xref_pos, 29) == "xref\n0 5\n0000000000 65535 f \n");
    assert(contains(out, "trailer\n<< /Size 5 /Root 3 0 R /Info 4 0 R /ID [ <"));

    auto pdf = open_pdf(out);
    assert(pdf->getWarnings().empty());
    assert(pdf->getPDFVersion() == "1.7");
    assert(pdf->getPageCount() == 1);
    auto page = pdf->getPage(0);
    assert(page.getKey("/MediaBox").getArrayItem(3).getIntValue() == 792);
    assert(page.getKey("/Parent").getRefObjGen() == DPDFObjGen(2, 0));
    assert(pdf->getPageContent(0).empty());
    assert(pdf->getInfo().getKey("/Producer").getStringValue() == "deltapdf");
    assert(starts_with(pdf->getInfo().getKey("/CreationDate").getStringValue(), "D:"));
    assert(pdf->getXRefTable().at(0).isFree());
    auto first_offset = static_cast<dpdf_offset_t>(out.find("1 0 obj"));
    assert(pdf->getXRefTable().at(1).getOffset() == first_offset);

    auto id = pdf->getTrailer().getKey("/ID");
    assert(id.getArrayNItems() == 2);
    assert(id.getArrayItem(0).getStringValue().size() == 16);
    assert(id.getArrayItem(0).getStringValue() == id.getArrayItem(1).getStringValue());
    assert(!pdf->isEncrypted());
}

static void
test_xref_stream()
{
    auto w = DPDFWriter::createMinimalDocument();
    w->setVersion("1.5");
    w->setXrefFormat(dpdf_xref_stream);
    auto out = w->write();
    assert(starts_with(out, "%PDF-1.5\n"));
    assert(!contains(out, "\nxref\n"));
    assert(!contains(out, "trailer"));
    // The stream takes the next object number and lists itself
    auto stream_pos = out.find("5 0 obj\n<< /Type /XRef /Size 6 /W [ 1 ");
    assert(stream_pos != std::string::npos);
    assert(contains(out, "/Index [ 0 6 ] /Filter /FlateDecode /Root 3 0 R /Info 4 0 R /ID [ <"));
    assert(contains(out, "startxref\n" + std::to_string(stream_pos) + "\n%%EOF\n"));

    auto pdf = open_pdf(out);
    assert(pdf->getWarnings().empty());
    assert(pdf->getPageCount() == 1);
    assert(pdf->getTrailer().getKey("/Size").getIntValue() == 6);
    assert(pdf->getTrailer().getKey("/ID").getArrayNItems() == 2);
    assert(pdf->getInfo().getKey("/Producer").getStringValue() == "deltapdf");
    auto const& xref = pdf->getXRefTable();
    assert(xref.at(0).isFree());
    assert(xref.at(5).getOffset() == static_cast<dpdf_offset_t>(stream_pos));
    assert(xref.at(3).getOffset() == static_cast<dpdf_offset_t>(out.find("3 0 obj")));
    assert(pdf->getNextObjectId() == 6);

    // Offsets past 64K need three bytes in the second field
    DPDFWriter big;
    big.setXrefFormat(dpdf_xref_stream);
    big.setCompression(false);
    add_page_with_content(big, content_stream(std::string(70000, ' ')));
    auto big_out = big.write();
    assert(contains(big_out, "/W [ 1 3 2 ]"));
    auto big_pdf = open_pdf(big_out);
    assert(big_pdf->getWarnings().empty());
    assert(big_pdf->getPageContent(0) == std::string(70000, ' '));
}

static void
test_compression()
{
    std::string content;
    for (int i = 0; i < 400; ++i) {
        content += "BT /F1 12 Tf " + std::to_string(i * 7 % 613) + " " +
            std::to_string(i * i % 997) + " Td (line " + std::to_string(i) + ") Tj ET\n";
    }

    DPDFWriter plain;
    plain.setCompression(false);
    add_page_with_content(plain, content_stream(content));
    auto plain_out = plain.write();
    assert(contains(plain_out, "stream\n" + content + "\nendstream"));
    assert(!contains(plain_out, "/FlateDecode"));

    DPDFWriter compressed;
    auto stream = content_stream(content);
    add_page_with_content(compressed, stream);
    auto compressed_out = compressed.write();
    assert(contains(compressed_out, "/Filter /FlateDecode"));
    assert(compressed_out.size() < plain_out.size());
    // The added stream itself is not changed
    assert(!stream.getDict().hasKey("/Filter"));
    assert(stream.getRawStreamData() == content);
    assert(open_pdf(compressed_out)->getPageContent(0) == content);

    // Streams that already have a filter are written as they are
    DPDFWriter filtered;
    add_page_with_content(
        filtered, content_stream("48656c6c6f>", "<< /Filter /ASCIIHexDecode >>"));
    auto filtered_out = filtered.write();
    assert(contains(filtered_out, "stream\n48656c6c6f>\nendstream"));
    assert(!contains(filtered_out, "/FlateDecode"));
    assert(open_pdf(filtered_out)->getPageContent(0) == "Hello");

    DPDFWriter fast;
    fast.setCompressionLevel(1);
    add_page_with_content(fast, content_stream(content));
    auto fast_out = fast.write();
    DPDFWriter best;
    best.setCompressionLevel(9);
    add_page_with_content(best, content_stream(content));
    auto best_out = best.write();
    assert(best_out.size() < fast_out.size());
    assert(open_pdf(fast_out)->getPageContent(0) == content);
    // The writer's level applies only while it writes
    assert(Pl_Flate::getCompressionLevel() == -1);

    try {
        best.setCompressionLevel(10);
        assert(false);
    } catch (std::logic_error& e) {
        std::cout << "logic error: " << e.what() << '\n';
    }
}

static void
test_objects()
{
    // The same objects give the same bytes, including the /ID
    auto make = [](std::string const& title) {
        DPDFWriter w;
        add_page_with_content(w, content_stream("0 0 m"));
        auto info = DPDFObjectHandle::newDictionary();
        auto ref = w.setInfo(info);
        assert(ref.getRefObjGen() == DPDFObjGen(5, 0));
        // Changes made after adding are written
        info.replaceKey("/Title", DPDFObjectHandle::newString(title));
        return w.write();
    };
    auto one = make("one");
    assert(make("one") == one);
    auto two = make("two");
    assert(two != one);
    auto id_one = open_pdf(one)->getTrailer().getKey("/ID").getArrayItem(0).getStringValue();
    auto pdf_two = open_pdf(two);
    assert(pdf_two->getTrailer().getKey("/ID").getArrayItem(0).getStringValue() != id_one);
    assert(pdf_two->getInfo().getKey("/Title").getStringValue() == "two");

    // Objects from a document can be written into a new one
    auto source = open_pdf(one);
    DPDFWriter copy;
    add_page_with_content(copy, source->getObject(1, 0).shallowCopy());
    auto copied = open_pdf(copy.write());
    assert(copied->getPageContent(0) == "0 0 m");
    assert(
        copied->getObject(1, 0).getRawStreamData() == source->getObject(1, 0).getRawStreamData());

    // Encryption dictionaries are referenced from the trailer
    DPDFWriter enc;
    add_page_with_content(enc, content_stream("q Q"));
    auto enc_ref = enc.setEncrypt(DPDFObjectHandle::parse("<< /Filter /Standard /V 1 >>"));
    auto enc_out = enc.write();
    assert(contains(enc_out, "/Encrypt " + enc_ref.unparse()));
    assert(open_pdf(enc_out)->isEncrypted());
}

static void
test_files_and_errors()
{
    auto w = DPDFWriter::createMinimalDocument();
    w->writeFile("writer-test.pdf");
    auto written = DUtil::read_file_into_string("writer-test.pdf");
    std::remove("writer-test.pdf");
    assert(open_pdf(written)->getPageCount() == 1);

    w->reset();
    assert(w->getNextObjectId() == 1);
    assert(w->getObject(1).isNull());
    try {
        w->write();
        assert(false);
    } catch (std::logic_error& e) {
        std::cout << "logic error: " << e.what() << '\n';
    }
    try {
        w->setCatalog(DPDFObjectHandle::newArray());
        assert(false);
    } catch (std::logic_error& e) {
        std::cout << "logic error: " << e.what() << '\n';
    }
    try {
        w->addObject(DPDFObjectHandle());
        assert(false);
    } catch (std::logic_error& e) {
        std::cout << "logic error: " << e.what() << '\n';
    }
    assert(w->getNextObjectId() == 1);
}

int
main()
{
    test_minimal_table();
    test_xref_stream();
    test_compression();
    test_objects();
    test_files_and_errors();
    std::cout << "writer tests done" << '\n';
    return 0;
}
