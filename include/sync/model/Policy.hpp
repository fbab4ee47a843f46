#pragma once

namespace ms::sync::model {

struct Policy {
    bool force = false;   // overwrite targets whose size differs
    bool fake = false;    // plan and report, never touch storage
    bool remove = false;  // delete target entries missing from the source
    bool watch = false;   // keep running on change notifications

    // Throws std::invalid_argument for combinations the engine refuses.
    void validate() const;

    [[nodiscard]] bool allowsDelete() const { return remove && force; }
};

}
