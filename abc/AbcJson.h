#pragma once

#include <QJsonObject>

#include "abc/AbcDocument.h"

namespace abc {

// {"fields":[{"key":"X","value":"1"},...],
//  "music":[{"type":"note","name":"F","accidental":"sharp","duration":2,"pitch":46},
//           {"type":"rest","duration":1}, ...]}
// "accidental" is omitted for notes without one.
QJsonObject eventToJson(const MusicEvent& event);
QJsonObject documentToJson(const AbcDocument& doc);

} // namespace abc
