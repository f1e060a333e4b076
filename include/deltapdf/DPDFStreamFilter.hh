// Copyright (c) 2024-2026 The deltapdf authors
//
// This file is part of deltapdf.
//
// Licensed under the Apache License, Version 2.0 (the "License"); you may not use this file except
// in compliance with the License. You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software distributed under the License
// is distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express
// or implied. See the License for the specific language governing permissions and limitations under
// the License.

#ifndef DPDFSTREAMFILTER_HH
#define DPDFSTREAMFILTER_HH

#include <deltapdf/DLL.h>
#include <deltapdf/DPDFObjectHandle.hh>
#include <deltapdf/Pipeline.hh>

#include <memory>
#include <string>

class DELTAPDF_DLL_CLASS DPDFStreamFilter
{
  public:
    DELTAPDF_DLL
    DPDFStreamFilter() = default;

    DELTAPDF_DLL
    virtual ~DPDFStreamFilter() = default;

    // A DPDFStreamFilter class must implement, at a minimum, setDecodeParms() and
    // getDecodePipeline(). setDecodeParms() is always called before getDecodePipeline(). It is
    // expected that you will store any needed information from decode_parms in your instance so
    // that it can be used to construct the decode pipeline.

    // Return a boolean indicating whether your filter can proceed with the given /DecodeParms. The
    // default implementation accepts a null object or an empty dictionary and rejects everything
    // else.
    DELTAPDF_DLL
    virtual bool setDecodeParms(DPDFObjectHandle decode_parms);

    // Return a pipeline that will decode data encoded with your filter. Your implementation must
    // ensure that the pipeline is deleted when the instance of your class is destroyed.
    DELTAPDF_DLL
    virtual Pipeline* getDecodePipeline(Pipeline* next) = 0;

    // Return a pipeline that encodes data so that the decode pipeline restores it, or nullptr if
    // the filter can only decode. This is the default. Encoding ignores decode parameters.
    DELTAPDF_DLL
    virtual Pipeline* getEncodePipeline(Pipeline* next);

    // Return a filter for the given filter name (with its leading "/"), or nullptr if the filter
    // is not supported. Standard abbreviations are accepted.
    DELTAPDF_DLL
    static std::shared_ptr<DPDFStreamFilter> create(std::string const& name);

    // Decode raw stream data. filter is null, a name, or an array of names. decode_parms is null,
    // a dictionary, or an array with one entry per filter. Filters are applied in order. All
    // objects must be direct; resolve indirect parameters before calling.
    //
    // Errors are reported by throwing DPDFExc with description as the file name:
    // dpdf_e_unsupported for an unsupported filter or decode parameter, dpdf_e_invalid_object for
    // malformed /Filter or /DecodeParms, and dpdf_e_corrupted for data that fails to decode.
    DELTAPDF_DLL
    static std::string decode(
        std::string const& raw,
        DPDFObjectHandle filter,
        DPDFObjectHandle decode_parms,
        std::string const& description = "");

    // Encode data for a stream whose /Filter is filter, so that decode(encode(data, filter),
    // filter, null) == data. With an array of filters, the last one is applied first. Filters
    // without an encoder (/LZWDecode) fail with dpdf_e_unsupported.
    DELTAPDF_DLL
    static std::string
    encode(std::string const& data, DPDFObjectHandle filter, std::string const& description = "");

  private:
    DPDFStreamFilter(DPDFStreamFilter const&) = delete;
    DPDFStreamFilter& operator=(DPDFStreamFilter const&) = delete;
};

#endif // DPDFSTREAMFILTER_HH
