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

#ifndef PDFSLICECONSTANTS_H
#define PDFSLICECONSTANTS_H

/*
 * Keep this file 'C' compatible. New values must be added to the end
 * of each enumeration so that no constant's numerical value changes.
 */

/* Exit codes from the pdfslice executable */

enum pdfslice_exit_code_e {
    pdfslice_exit_success = 0,
    pdfslice_exit_error = 2,
};

/* Error codes carried by PDFSliceExc */

enum pdfslice_error_code_e {
    pdfslice_e_success = 0,
    pdfslice_e_validation, /* malformed caller input, detected before I/O */
    pdfslice_e_not_found,  /* input path does not exist */
    pdfslice_e_codec,      /* document or page could not be read */
    pdfslice_e_range,      /* requested range exceeds document length */
    pdfslice_e_write,      /* output document could not be written */
};

#endif /* PDFSLICECONSTANTS_H */
