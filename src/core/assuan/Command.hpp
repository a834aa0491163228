#pragma once

#include <QByteArray>
#include <QByteArrayView>
#include <QList>

namespace elephantine::assuan {

    enum class Verb {
        Option,
        SetDesc,
        SetPrompt,
        SetTitle,
        SetOk,
        SetCancel,
        SetNotOk,
        SetError,
        SetKeyInfo,
        SetRepeat,
        SetRepeatError,
        SetRepeatOk,
        SetQualityBar,
        SetQualityBarTt,
        SetGenPin,
        SetGenPinTt,
        SetTimeout,
        GetPin,
        Confirm,
        Message,
        GetInfo,
        ClearPassphrase,
        Reset,
        Nop,
        Help,
        Bye,
        End,
        Quit,
        Cancel,
        Auth,
        Unknown
    };

    struct Command {
        Verb       verb = Verb::Unknown;
        QByteArray name;     // verb as received, upper-cased
        QByteArray argument; // percent-decoded
    };

    // Case-insensitive; anything not in the supported set maps to Verb::Unknown.
    Verb        verbFromName(QByteArrayView name);
    QByteArray  verbName(Verb verb);
    QList<Verb> supportedVerbs();

} // namespace elephantine::assuan
