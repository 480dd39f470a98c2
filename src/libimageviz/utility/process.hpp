/*
 * imageviz
 *
 * Copyright (c) 2024, the imageviz authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libimageviz_utility_process_hpp
#define libimageviz_utility_process_hpp

namespace libimageviz {
namespace process {

bool isTerminal(int fileDescriptor);

}}

#endif
