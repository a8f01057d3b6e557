#pragma once

#include "chatlog/conversation/v1/events.pb.h"
#include "chatlog/conversation/v1/state.pb.h"

namespace chatlog::v1 {
using namespace ::chatlog::conversation::v1;
}
