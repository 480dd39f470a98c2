/*
 * imageviz
 *
 * Copyright (c) 2024, the imageviz authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libimageviz_LogLevel_hpp
#define libimageviz_LogLevel_hpp

namespace libimageviz {

enum class LogLevel {DEBUG, INFO, WARN, ERROR, GENERAL};

}

#endif
