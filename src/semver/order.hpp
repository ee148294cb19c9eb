#pragma once

namespace semver {

enum class order {
    less,
    equivalent,
    greater,
};

}  // namespace semver
