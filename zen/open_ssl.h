// *****************************************************************************
// * This file is part of the UniXfer project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The UniXfer Authors - All Rights Reserved                   *
// *****************************************************************************

#ifndef OPEN_SSL_H_801974580936508934568792347506
#define OPEN_SSL_H_801974580936508934568792347506

#include <string_view>
#include "sys_error.h"


namespace zen
{
//init OpenSSL before use!
void openSslInit();
void openSslTearDown();

//runtime depends on length only, not on content; strings of different length are unequal
bool constantTimeEquals(std::string_view lhs, std::string_view rhs);
}

#endif //OPEN_SSL_H_801974580936508934568792347506
