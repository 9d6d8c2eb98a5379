#pragma once

#include "workstream/v1/types.pb.h"
#include "workstream/v1/api.pb.h"
