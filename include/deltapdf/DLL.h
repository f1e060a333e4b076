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

#ifndef DELTAPDF_DLL_HH
#define DELTAPDF_DLL_HH

#define DELTAPDF_MAJOR_VERSION 1
#define DELTAPDF_MINOR_VERSION 0
#define DELTAPDF_PATCH_VERSION 0
#define DELTAPDF_VERSION "1.0.0"

/*
 * DELTAPDF_DLL marks functions and methods that are part of the public ABI. DELTAPDF_DLL_CLASS
 * marks classes whose runtime type information must be exported: exceptions, classes meant to be
 * subclassed (Pipeline, DPDFStreamFilter), and anything that may be the target of dynamic_cast
 * across the shared library boundary. DELTAPDF_DLL_PRIVATE hides a member of an exported class.
 *
 * The library is built with -fvisibility=hidden so that only marked symbols are exported.
 */

#if defined _WIN32 || defined __CYGWIN__
# ifdef libdeltapdf_EXPORTS
#  define DELTAPDF_DLL __declspec(dllexport)
# else
#  define DELTAPDF_DLL
# endif
# define DELTAPDF_DLL_PRIVATE
#elif defined __GNUC__
# define DELTAPDF_DLL __attribute__((visibility("default")))
# define DELTAPDF_DLL_PRIVATE __attribute__((visibility("hidden")))
#else
# define DELTAPDF_DLL
# define DELTAPDF_DLL_PRIVATE
#endif
#ifdef __GNUC__
# define DELTAPDF_DLL_CLASS DELTAPDF_DLL
#else
# define DELTAPDF_DLL_CLASS
#endif

#endif /* DELTAPDF_DLL_HH */
