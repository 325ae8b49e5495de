#pragma once

#include "famgraph/v1/types.pb.h"
#include "famgraph/v1/family_service.pb.h"
