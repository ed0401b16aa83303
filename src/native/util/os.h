/* Copyright (C) 2016 NooBaa */
#pragma once

#include <sys/types.h>

namespace dataid
{

// see os_linux.cpp

pid_t get_current_tid();

} // namespace dataid
