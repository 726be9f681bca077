#include "dentassist/assistant/prompts.hpp"

#include <algorithm>

namespace dentassist::assistant {

namespace {

auto contact_channel(const ClinicConfig& clinic) -> std::string {
    if (!clinic.contact_phone.empty() && !clinic.contact_email.empty()) {
        return "call " + clinic.name + " at " + clinic.contact_phone + " or email " +
               clinic.contact_email;
    }
    if (!clinic.contact_phone.empty()) {
        return "call " + clinic.name + " at " + clinic.contact_phone;
    }
    if (!clinic.contact_email.empty()) {
        return "email " + clinic.name + " at " + clinic.contact_email;
    }
    return "contact " + clinic.name + " directly";
}

} // anonymous namespace

auto system_prompt(const ClinicConfig& clinic) -> std::string {
    return
        "You are the chat assistant for " + clinic.name + ", a dental practice. "
        "You help patients with "
        "general dental care questions and with information about the clinic.\n"
        "\n"
        "Tone:\n"
        "- Warm and conversational, never stiff or overly formal.\n"
        "- When you rely on clinic information, say \"From our clinic information\" or "
        "\"Based on what I know\". Never mention a \"context\" or a knowledge base.\n"
        "- Get to the point while staying professional.\n"
        "\n"
        "You may:\n"
        "1. Explain dental health topics, procedures and everyday care.\n"
        "2. Share clinic-specific details when they are provided to you.\n"
        "3. Suggest seeing a dentist for anything that needs a personal assessment.\n"
        "\n"
        "Rules:\n"
        "- Never give a diagnosis or prescribe a treatment.\n"
        "- If you do not know the answer, say so and suggest that the patient " +
        contact_channel(clinic) + ".\n"
        "- Keep answers short and useful.\n"
        "- Where it fits, invite the patient to book an appointment.";
}

auto context_block(const std::vector<retrieval::SearchResult>& results) -> std::string {
    std::string out;
    for (const auto& r : results) {
        if (!out.empty()) out += "\n\n";
        out += "Q: " + r.question + "\nA: " + r.answer;
    }
    return out;
}

auto user_prompt(std::string_view query, std::string_view context) -> std::string {
    if (context.empty()) {
        return "A patient asks: " + std::string(query) + "\n"
            "\n"
            "There is no clinic-specific information on this topic. Give friendly, general "
            "dental guidance and recommend contacting the dental office for advice about "
            "their own situation.";
    }
    return
        "Below is information from our dental practice that may help with the patient's "
        "question. Use whatever is relevant; you do not have to use all of it.\n"
        "\n"
        "INFORMATION:\n" +
        std::string(context) + "\n"
        "\n"
        "PATIENT QUESTION: " + std::string(query) + "\n"
        "\n"
        "Instructions:\n"
        "- Answer naturally, weaving in the information above where it applies.\n"
        "- Combine several items if that gives a better answer.\n"
        "- If the information only partly answers the question, add general dental guidance.\n"
        "- Suggest contacting the dental office for anything specific to the patient.";
}

auto fallback_answer(const ClinicConfig& clinic) -> std::string {
    return "I'm sorry, I'm having trouble answering right now. Please try again in a few "
           "minutes, or " + contact_channel(clinic) + " and our team will be happy to help.";
}

auto history_messages(const std::vector<chat::ChatMessage>& history, size_t max_turns)
    -> std::vector<Message> {
    std::vector<Message> out;
    if (max_turns == 0) return out;

    // A turn is a user message plus its reply.
    size_t keep = std::min(history.size(), max_turns * 2);
    for (size_t i = history.size() - keep; i < history.size(); ++i) {
        const auto& m = history[i];
        if (m.role == Role::System || m.content.empty()) continue;
        out.push_back(Message{.role = m.role, .content = m.content});
    }
    // Providers expect the exchange to open with a user turn.
    while (!out.empty() && out.front().role != Role::User) {
        out.erase(out.begin());
    }
    return out;
}

} // namespace dentassist::assistant
