#include "color.h"

namespace sqlan::cli {

Color kColor;

}  // namespace sqlan::cli
