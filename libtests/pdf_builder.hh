#ifndef PDF_BUILDER_HH
#define PDF_BUILDER_HH

// Helpers shared by the tests that need whole PDF files. PDFBuilder assembles a file in memory and
// keeps track of where each object starts so that the cross-reference data it writes is correct.

#include <deltapdf/DPDF.hh>
#include <deltapdf/DPDFExc.hh>
#include <deltapdf/DUtil.hh>

#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>

class PDFBuilder
{
  public:
    // An entry for a cross-reference stream written with /W [ 1 2 1 ]
    struct Entry
    {
        int obj;
        int type;
        long long f1;
        int f2;
    };

    explicit PDFBuilder(std::string const& header = "%PDF-1.7\n") :
        data(header)
    {
    }

    dpdf_offset_t
    addObject(int num, std::string const& body, int gen = 0)
    {
        auto offset = static_cast<dpdf_offset_t>(data.size());
        pending[num] = {gen, offset};
        data += std::to_string(num) + " " + std::to_string(gen) + " obj\n" + body + "\nendobj\n";
        return offset;
    }

    // Write a classic table covering every object added since the previous table, followed by
    // the trailer. Returns the offset of the xref keyword.
    dpdf_offset_t
    addXrefTable(std::string const& trailer, bool free_head = true)
    {
        auto offset = static_cast<dpdf_offset_t>(data.size());
        data += "xref\n";
        if (free_head) {
            data += "0 1\n0000000000 65535 f \n";
        }
        auto iter = pending.begin();
        while (iter != pending.end()) {
            auto end = iter;
            int count = 0;
            int next = iter->first;
            while (end != pending.end() && end->first == next) {
                ++end;
                ++next;
                ++count;
            }
            data += std::to_string(iter->first) + " " + std::to_string(count) + "\n";
            for (; iter != end; ++iter) {
                data += DUtil::int_to_string(iter->second.second, 10) + " " +
                    DUtil::int_to_string(iter->second.first, 5) + " n \n";
            }
        }
        data += "trailer\n" + trailer + "\n";
        pending.clear();
        return offset;
    }

    // Write object num as a cross-reference stream with the given entries plus an entry for
    // itself. If length_obj is not 0, /Length is an indirect reference to that object, which is
    // written right after the stream and listed in it. Returns the offset of the stream object.
    dpdf_offset_t
    addXrefStream(
        int num, std::vector<Entry> entries, std::string const& keys = "", int length_obj = 0)
    {
        auto offset = static_cast<dpdf_offset_t>(data.size());
        entries.push_back({num, 1, offset, 0});
        if (length_obj) {
            // Filled in below once the size of the stream object is known
            entries.push_back({length_obj, 1, 0, 0});
        }
        std::map<int, Entry> sorted;
        for (auto const& e: entries) {
            sorted[e.obj] = e;
        }

        std::string index;
        for (auto iter = sorted.begin(); iter != sorted.end();) {
            auto first = iter->first;
            int count = 0;
            while (iter != sorted.end() && iter->first == first + count) {
                ++iter;
                ++count;
            }
            index += std::to_string(first) + " " + std::to_string(count) + " ";
        }
        size_t data_len = 4 * sorted.size();
        std::string dict = "<< /Type /XRef /Size " + std::to_string(sorted.rbegin()->first + 1) +
            " /W [ 1 2 1 ] /Index [ " + index + "] " + keys + " /Length " +
            (length_obj ? std::to_string(length_obj) + " 0 R" : std::to_string(data_len)) + " >>";
        std::string head = std::to_string(num) + " 0 obj\n" + dict + "\nstream\n";
        std::string tail = "\nendstream\nendobj\n";
        if (length_obj) {
            sorted[length_obj].f1 =
                offset + static_cast<long long>(head.size() + data_len + tail.size());
        }

        std::string bin;
        for (auto const& [obj, e]: sorted) {
            bin += static_cast<char>(e.type);
            bin += static_cast<char>((e.f1 >> 8) & 0xff);
            bin += static_cast<char>(e.f1 & 0xff);
            bin += static_cast<char>(e.f2 & 0xff);
        }
        data += head + bin + tail;
        if (length_obj) {
            data += std::to_string(length_obj) + " 0 obj\n" + std::to_string(data_len) +
                "\nendobj\n";
        }
        return offset;
    }

    // Write an object stream holding the given objects in order
    dpdf_offset_t
    addObjectStream(int num, std::vector<std::pair<int, std::string>> const& objects)
    {
        std::string header;
        std::string body;
        for (auto const& [obj, value]: objects) {
            header += std::to_string(obj) + " " + std::to_string(body.size()) + " ";
            body += value + "\n";
        }
        auto content = header + body;
        return addObject(
            num,
            "<< /Type /ObjStm /N " + std::to_string(objects.size()) + " /First " +
                std::to_string(header.size()) + " /Length " + std::to_string(content.size()) +
                " >>\nstream\n" + content + "\nendstream");
    }

    void
    finish(dpdf_offset_t startxref)
    {
        data += "startxref\n" + std::to_string(startxref) + "\n%%EOF\n";
        pending.clear();
    }

    std::string data;

  private:
    std::map<int, std::pair<int, dpdf_offset_t>> pending;
};

inline std::shared_ptr<DPDF>
open_pdf(std::string const& data, bool recover = false)
{
    auto pdf = DPDF::create();
    pdf->setSuppressWarnings(true);
    pdf->setAttemptRecovery(recover);
    pdf->processMemoryFile("test.pdf", data.data(), data.size());
    return pdf;
}

// Return the error code from opening data or dpdf_e_success if it opens cleanly
inline dpdf_error_code_e
open_error(std::string const& data, bool recover = false)
{
    try {
        open_pdf(data, recover);
    } catch (DPDFExc& e) {
        std::cout << "open error: " << e.what() << '\n';
        return e.getErrorCode();
    }
    return dpdf_e_success;
}

inline bool
has_warning(std::vector<DPDFExc> const& warnings, std::string const& text)
{
    for (auto const& w: warnings) {
        if (w.getMessageDetail().find(text) != std::string::npos) {
            return true;
        }
    }
    return false;
}

// A catalog, a page tree node and one page as objects 1, 2 and 3
inline void
add_basic_pages(PDFBuilder& b)
{
    b.addObject(1, "<< /Type /Catalog /Pages 2 0 R >>");
    b.addObject(2, "<< /Type /Pages /Kids [ 3 0 R ] /Count 1 >>");
    b.addObject(3, "<< /Type /Page /Parent 2 0 R /MediaBox [ 0 0 612 792 ] >>");
}

#endif // PDF_BUILDER_HH
