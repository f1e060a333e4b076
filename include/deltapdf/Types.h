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

#ifndef DELTAPDFTYPES_H
#define DELTAPDFTYPES_H

/* Byte offsets into PDF files. Always 64 bits so that large files can be addressed on every
 * platform.
 */
typedef long long int dpdf_offset_t;

#endif /* DELTAPDFTYPES_H */
