/*
 * imageviz
 *
 * Copyright (c) 2024, the imageviz authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libimageviz_Utility_hpp
#define libimageviz_Utility_hpp

#include "libimageviz/utility/json.hpp"
#include "libimageviz/utility/logging.hpp"
#include "libimageviz/utility/process.hpp"

#endif
