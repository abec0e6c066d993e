#include "daemon/snapshot_differ.hpp"

namespace matchwatch {

std::vector<ChangeEvent> SnapshotDiffer::diff(const std::optional<Snapshot> &previous,
                                              const Snapshot &current)
{
    std::vector<ChangeEvent> changes;
    if (!previous.has_value()) {
        return changes;
    }

    for (const auto &[id, player] : current.players) {
        const auto it = previous->players.find(id);
        if (it == previous->players.end()) {
            continue;
        }
        const PlayerState &before = it->second;

        if (before.alive && !player.alive) {
            ChangeEvent change;
            change.kind = ChangeKind::PlayerDied;
            change.player = player;
            changes.push_back(std::move(change));
        }

        if (player.weapon.has_value() && !player.weapon->empty()
            && before.weapon != player.weapon) {
            ChangeEvent change;
            change.kind = ChangeKind::WeaponChange;
            change.player = player;
            change.oldWeapon = before.weapon;
            change.newWeapon = *player.weapon;
            changes.push_back(std::move(change));
        }
    }

    return changes;
}

} // namespace matchwatch
