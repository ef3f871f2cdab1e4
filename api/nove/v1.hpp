#pragma once

#include "nove/v1/common.pb.h"
#include "nove/v1/contact.pb.h"
#include "nove/v1/license.pb.h"
#include "nove/v1/mail.pb.h"
