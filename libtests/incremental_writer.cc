#include <deltapdf/assert_test.h>

// This program tests appending incremental updates to existing files

#include "pdf_builder.hh"

#include <deltapdf/DPDF.hh>
#include <deltapdf/DPDFExc.hh>
#include <deltapdf/DPDFIncrementalWriter.hh>
#include <deltapdf/DPDFObjectHandle.hh>
#include <deltapdf/DUtil.hh>

#include <cstdio>
#include <iostream>
#include <stdexcept>

static std::string
original_file(std::string const& extra_trailer_keys = "")
{
    PDFBuilder b;
    add_basic_pages(b);
    b.finish(b.addXrefTable("<< /Size 4 /Root 1 0 R " + extra_trailer_keys + ">>"));
    return b.data;
}

static bool
starts_with(std::string const& str, std::string const& prefix)
{
    return str.compare(0, prefix.size(), prefix) == 0;
}

static void
test_update()
{
    auto original = original_file();
    auto pdf = open_pdf(original);
    DPDFIncrementalWriter w(*pdf);
    assert(w.getChangeCount() == 0);
    assert(w.write() == original);

    auto page = pdf->getObject(3, 0).shallowCopy();
    page.replaceKey("/MediaBox", DPDFObjectHandle::parse("[ 0 0 200 200 ]"));
    w.replaceObject(3, page);
    w.replaceObject(pdf->getNextObjectId(), "(new object)");
    assert(w.getChangeCount() == 2);
    auto out = w.write();

    // The original bytes are untouched
    assert(out.size() > original.size());
    assert(starts_with(out, original));
    auto delta = out.substr(original.size());
    assert(starts_with(delta, "3 0 obj\n"));
    assert(delta.find("\nxref\n3 2\n") != std::string::npos);
    assert(delta.find("\nendobj\n4 0 obj\n(new object)\nendobj\n") != std::string::npos);
    assert(
        delta.find("trailer\n<< /Size 5 /Root 1 0 R /Prev " +
                   std::to_string(pdf->getStartXRef()) + " >>\nstartxref\n") !=
        std::string::npos);
    assert(out.substr(out.size() - 6) == "%%EOF\n");

    auto updated = open_pdf(out);
    assert(updated->getWarnings().empty());
    assert(updated->getTrailers().size() == 2);
    auto offsets = updated->getXRefSectionOffsets();
    assert(offsets.at(1) == pdf->getStartXRef());
    assert(
        updated->getTrailer().getKey("/Prev").getIntValue() == pdf->getStartXRef());
    assert(updated->getObject(3, 0).getKey("/MediaBox").getArrayItem(2).getIntValue() == 200);
    assert(updated->getObject(4, 0).getStringValue() == "new object");
    assert(updated->getPageCount() == 1);
    auto const& xref = updated->getXRefTable();
    assert(xref.at(3).getOffset() == static_cast<dpdf_offset_t>(original.size()));
    assert(xref.at(1).getOffset() == 9);

    // A second update on top of the first
    DPDFIncrementalWriter w2(*updated);
    w2.replaceObject(2, "<< /Type /Pages /Kids [ 3 0 R 5 0 R ] /Count 2 >>");
    w2.replaceObject(5, "<< /Type /Page /Parent 2 0 R >>");
    auto out2 = w2.write();
    assert(starts_with(out2, out));
    auto twice = open_pdf(out2);
    assert(twice->getTrailers().size() == 3);
    assert(twice->getTrailer().getKey("/Prev").getIntValue() == updated->getStartXRef());
    assert(twice->getTrailer().getKey("/Size").getIntValue() == 6);
    assert(twice->getPageCount() == 2);
    // Changes from both updates are visible
    assert(twice->getObject(4, 0).getStringValue() == "new object");
    assert(twice->getObject(3, 0).getKey("/MediaBox").getArrayItem(2).getIntValue() == 200);
    auto twice_offsets = twice->getXRefSectionOffsets();
    assert(twice_offsets.at(1) == updated->getStartXRef());
    assert(twice_offsets.at(2) == pdf->getStartXRef());
}

static void
test_subsections()
{
    auto original = original_file();
    auto pdf = open_pdf(original);
    std::map<int, std::string> changes = {
        {7, "(seven)"},
        {2, "<< /Type /Pages /Kids [ 3 0 R ] /Count 1 >>"},
        {3, "<< /Type /Page /Parent 2 0 R /Rotate 90 >>"},
    };
    auto out = DPDFIncrementalWriter::writeUpdate(
        original, changes, pdf->getTrailer(), pdf->getNextObjectId());
    auto delta = out.substr(original.size());
    // Objects are written in order of object number
    assert(delta.find("2 0 obj") < delta.find("3 0 obj"));
    assert(delta.find("3 0 obj") < delta.find("7 0 obj"));
    auto xref = delta.substr(delta.find("xref\n"));
    assert(starts_with(xref, "xref\n2 2\n"));
    assert(xref.find("\n7 1\n") != std::string::npos);
    // Each entry is 20 bytes
    auto first_entry = xref.substr(9, 20);
    assert(first_entry.size() == 20);
    assert(first_entry.substr(10) == " 00000 n \n");
    assert(
        DUtil::string_to_ll(first_entry.substr(0, 10).c_str()) ==
        static_cast<long long>(original.size()));

    auto updated = open_pdf(out);
    assert(updated->getTrailer().getKey("/Size").getIntValue() == 8);
    assert(updated->getObject(7, 0).getStringValue() == "seven");
    assert(updated->getAllPages().at(0).getKey("/Rotate").getIntValue() == 90);
    assert(updated->getNextObjectId() == 8);

    // An empty change set leaves the file alone
    assert(
        DPDFIncrementalWriter::writeUpdate(original, {}, pdf->getTrailer(), 4) == original);
}

static void
test_line_endings()
{
    auto original = original_file();
    original.pop_back();
    assert(original.back() == 'F');
    auto pdf = open_pdf(original);
    DPDFIncrementalWriter w(*pdf);
    w.replaceObject(2, "<< /Type /Pages /Kids [ 3 0 R ] /Count 1 >>");
    auto out = w.write();
    assert(starts_with(out, original));
    assert(starts_with(out.substr(original.size()), "\n2 0 obj\n"));
    assert(open_pdf(out)->getXRefTable().at(2).getOffset() ==
           static_cast<dpdf_offset_t>(original.size() + 1));
    assert(open_pdf(out)->getPageCount() == 1);
}

static void
test_trailer_keys()
{
    std::string id = "<00112233445566778899aabbccddeeff>";
    auto original = original_file("/Info 3 0 R /Encrypt << /Filter /Standard >> /ID [ " + id +
                                  " " + id + " ] ");
    auto pdf = open_pdf(original);
    DPDFIncrementalWriter w(*pdf);
    w.replaceObject(4, "(extra)");

    auto same_id = open_pdf(w.write());
    auto t = same_id->getTrailer();
    assert(t.getKey("/Info").getRefObjGen() == DPDFObjGen(3, 0));
    assert(t.getKey("/Encrypt").getKey("/Filter").getName() == "/Standard");
    assert(t.getKey("/ID").getArrayItem(0).unparse() == id);
    assert(t.getKey("/ID").getArrayItem(1).unparse() == id);
    assert(same_id->isEncrypted());

    w.setUpdateID(true);
    auto out = w.write();
    assert(out == w.write());
    auto new_id = open_pdf(out)->getTrailer().getKey("/ID");
    assert(new_id.getArrayNItems() == 2);
    assert(new_id.getArrayItem(0).unparse() == id);
    assert(new_id.getArrayItem(1).unparse() != id);
    assert(new_id.getArrayItem(1).getStringValue().size() == 16);
    assert(new_id.getArrayItem(1).isHexString());

    // Without /ID there is nothing to update
    auto plain = open_pdf(original_file());
    DPDFIncrementalWriter pw(*plain);
    pw.setUpdateID(true);
    pw.replaceObject(4, "(extra)");
    assert(!open_pdf(pw.write())->getTrailer().hasKey("/ID"));
}

static void
test_streams_and_files()
{
    auto original = original_file();
    auto pdf = open_pdf(original);
    DPDFIncrementalWriter w(*pdf);
    auto dict = DPDFObjectHandle::newDictionary();
    dict.replaceKey("/Filter", DPDFObjectHandle::newName("/ASCIIHexDecode"));
    w.replaceObject(4, DPDFObjectHandle::newStream(dict, "73747265616d2064617461>"));
    w.writeFile("incremental-writer-test.pdf");
    auto written = DUtil::read_file_into_string("incremental-writer-test.pdf");
    assert(written == w.write());
    std::remove("incremental-writer-test.pdf");

    auto updated = open_pdf(written);
    auto stream = updated->getObject(4, 0);
    assert(stream.isStream());
    assert(stream.getDict().getKey("/Length").getIntValue() == 23);
    assert(updated->getStreamData(stream) == "stream data");
}

static void
test_errors()
{
    auto pdf = open_pdf(original_file());
    DPDFIncrementalWriter w(*pdf);
    try {
        w.replaceObject(0, "null");
        assert(false);
    } catch (std::logic_error& e) {
        std::cout << "logic error: " << e.what() << '\n';
    }
    try {
        w.replaceObject(1, DPDFObjectHandle());
        assert(false);
    } catch (std::logic_error& e) {
        std::cout << "logic error: " << e.what() << '\n';
    }
    try {
        DPDFIncrementalWriter::writeUpdate(
            original_file(), {{1, "null"}}, DPDFObjectHandle::newNull(), 4);
        assert(false);
    } catch (std::logic_error& e) {
        std::cout << "logic error: " << e.what() << '\n';
    }
    try {
        DPDFIncrementalWriter::writeUpdate(
            "%PDF-1.7\nno cross-reference data\n",
            {{1, "null"}},
            DPDFObjectHandle::parse("<< /Size 2 >>"),
            2);
        assert(false);
    } catch (DPDFExc& e) {
        std::cout << "writer error: " << e.what() << '\n';
        assert(e.getErrorCode() == dpdf_e_invalid_xref);
    }
}

int
main()
{
    test_update();
    test_subsections();
    test_line_endings();
    test_trailer_keys();
    test_streams_and_files();
    test_errors();
    std::cout << "incremental writer tests done" << '\n';
    return 0;
}
