#pragma once

#include "jobflow/workflow/v1/records.pb.h"

namespace jobflow::v1 {
using namespace ::jobflow::workflow::v1;
}
