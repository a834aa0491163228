#include "Command.hpp"

namespace elephantine::assuan {

    QByteArray verbName(Verb verb) {
        switch (verb) {
            case Verb::Option: return "OPTION";
            case Verb::SetDesc: return "SETDESC";
            case Verb::SetPrompt: return "SETPROMPT";
            case Verb::SetTitle: return "SETTITLE";
            case Verb::SetOk: return "SETOK";
            case Verb::SetCancel: return "SETCANCEL";
            case Verb::SetNotOk: return "SETNOTOK";
            case Verb::SetError: return "SETERROR";
            case Verb::SetKeyInfo: return "SETKEYINFO";
            case Verb::SetRepeat: return "SETREPEAT";
            case Verb::SetRepeatError: return "SETREPEATERROR";
            case Verb::SetRepeatOk: return "SETREPEATOK";
            case Verb::SetQualityBar: return "SETQUALITYBAR";
            case Verb::SetQualityBarTt: return "SETQUALITYBAR_TT";
            case Verb::SetGenPin: return "SETGENPIN";
            case Verb::SetGenPinTt: return "SETGENPIN_TT";
            case Verb::SetTimeout: return "SETTIMEOUT";
            case Verb::GetPin: return "GETPIN";
            case Verb::Confirm: return "CONFIRM";
            case Verb::Message: return "MESSAGE";
            case Verb::GetInfo: return "GETINFO";
            case Verb::ClearPassphrase: return "CLEARPASSPHRASE";
            case Verb::Reset: return "RESET";
            case Verb::Nop: return "NOP";
            case Verb::Help: return "HELP";
            case Verb::Bye: return "BYE";
            case Verb::End: return "END";
            case Verb::Quit: return "QUIT";
            case Verb::Cancel: return "CANCEL";
            case Verb::Auth: return "AUTH";
            case Verb::Unknown: break;
        }
        return QByteArray();
    }

    QList<Verb> supportedVerbs() {
        QList<Verb> verbs;
        for (int v = static_cast<int>(Verb::Option); v < static_cast<int>(Verb::Unknown); ++v)
            verbs << static_cast<Verb>(v);
        return verbs;
    }

    Verb verbFromName(QByteArrayView name) {
        if (name.isEmpty())
            return Verb::Unknown;

        const QByteArray upper = name.toByteArray().toUpper();
        for (Verb verb : supportedVerbs()) {
            if (verbName(verb) == upper)
                return verb;
        }
        return Verb::Unknown;
    }

} // namespace elephantine::assuan
