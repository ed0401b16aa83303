/* Copyright (C) 2016 NooBaa */
#include "common.h"

namespace dataid
{

bool LOG_TO_STDERR_ENABLED = true;

int dataid_debug_level = 0;

} // namespace dataid
