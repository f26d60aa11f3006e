#pragma once

#include "cardposter/v1/card.pb.h"
#include "cardposter/v1/export.pb.h"
