/* Copyright (c) 2026 The pdfslice Authors
 *
 * This file is part of pdfslice.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *   http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#ifndef PDFSLICE_DLL_HH
#define PDFSLICE_DLL_HH

#define PDFSLICE_MAJOR_VERSION 1
#define PDFSLICE_MINOR_VERSION 0
#define PDFSLICE_PATCH_VERSION 0
#define PDFSLICE_VERSION "1.0.0"

/*
 * PDFSLICE_DLL marks functions and methods that are part of the
 * public ABI. PDFSLICE_DLL_CLASS marks classes whose runtime type
 * information must be visible outside the library, which is needed
 * for classes that are thrown as exceptions or inherited from. The
 * library is built with hidden visibility, so anything not marked is
 * private to it. This follows the same scheme as qpdf's DLL.h.
 */

#if defined _WIN32 || defined __CYGWIN__
# ifdef libpdfslice_EXPORTS
#  define PDFSLICE_DLL __declspec(dllexport)
# else
#  define PDFSLICE_DLL
# endif
# define PDFSLICE_DLL_PRIVATE
#elif defined __GNUC__
# define PDFSLICE_DLL __attribute__((visibility("default")))
# define PDFSLICE_DLL_PRIVATE __attribute__((visibility("hidden")))
#else
# define PDFSLICE_DLL
# define PDFSLICE_DLL_PRIVATE
#endif
#ifdef __GNUC__
# define PDFSLICE_DLL_CLASS PDFSLICE_DLL
#else
# define PDFSLICE_DLL_CLASS
#endif

#endif /* PDFSLICE_DLL_HH */
