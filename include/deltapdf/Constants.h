/* Copyright (c) 2024-2026 The deltapdf authors
 *
 * This file is part of deltapdf.
 *
 * Licensed under the Apache License, Version 2.0 (the "License"); you may not use this file except
 * in compliance with the License. You may obtain a copy of the License at
 *
 *   http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software distributed under the License
 * is distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express
 * or implied. See the License for the specific language governing permissions and limitations under
 * the License.
 */

#ifndef DELTAPDFCONSTANTS_H
#define DELTAPDFCONSTANTS_H

/*
 * Keep this file 'C' compatible.
 *
 * New values must be added to the end of each enumeration so that no constant's numerical value
 * ever changes.
 */

/* Error Codes */

enum dpdf_error_code_e {
    dpdf_e_success = 0,
    dpdf_e_internal,         /* logic/programming error -- indicates bug */
    dpdf_e_system,           /* I/O error, memory error, etc. */
    dpdf_e_lex,              /* malformed token */
    dpdf_e_unexpected_token, /* grammar violation */
    dpdf_e_unexpected_eof,   /* input ends in the middle of a structure */
    dpdf_e_invalid_object,   /* semantically malformed object, reference cycle */
    dpdf_e_invalid_xref,     /* malformed cross-reference table or stream */
    dpdf_e_corrupted,        /* damaged stream data or stream lengths */
    dpdf_e_unsupported,      /* PDF feature not supported by deltapdf */
};

/* Object Types */

enum dpdf_object_type_e {
    dpdf_ot_uninitialized,
    dpdf_ot_null,
    dpdf_ot_boolean,
    dpdf_ot_integer,
    dpdf_ot_real,
    dpdf_ot_string,
    dpdf_ot_name,
    dpdf_ot_array,
    dpdf_ot_dictionary,
    dpdf_ot_reference,
    dpdf_ot_stream,
};

/* Cross-reference formats for DPDFWriter */

enum dpdf_xref_format_e {
    dpdf_xref_table,  /* "xref" keyword, fixed-width lines and a trailer dictionary */
    dpdf_xref_stream, /* /Type /XRef stream object, PDF 1.5 and later */
};

#endif /* DELTAPDFCONSTANTS_H */
