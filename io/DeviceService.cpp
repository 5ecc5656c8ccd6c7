#include "DeviceService.hpp"

namespace livecopy::io {

DeviceService::~DeviceService() {}

}
