/* Copyright (C) 2016 NooBaa */
#include "os.h"

#include <sys/syscall.h>
#include <unistd.h>

namespace dataid
{

pid_t
get_current_tid()
{
#ifdef SYS_gettid
    return syscall(SYS_gettid);
#else
    return getpid();
#endif
}

} // namespace dataid
