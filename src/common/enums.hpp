#pragma once

namespace matchwatch {

enum class HealthBucket {
    Full,
    Damaged,
    Critical,
    Unknown
};

enum class ArmorBucket {
    None,
    Light,
    Heavy,
    Unknown
};

enum class ChangeKind {
    PlayerDied,
    WeaponChange
};

enum class VisualLabel {
    Kill,
    Death,
    RoundEnd,
    NoEvent,
    Error
};

} // namespace matchwatch
