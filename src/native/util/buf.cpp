/* Copyright (C) 2016 NooBaa */
#include "buf.h"

namespace dataid
{

const char Buf::HEX_CHARS[] = {
    '0', '1', '2', '3', '4', '5', '6', '7', '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'
};

} // namespace dataid
