#pragma once

#include "kag/context/v1/context.pb.h"
#include "kag/context/v1/context_service.pb.h"

