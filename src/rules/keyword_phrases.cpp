#include "keyword_phrases.hpp"

#include <fmt/core.h>

namespace rules {

using models::SectionType;

static constexpr std::string_view kNonWord = R"([^\pL\pM\pN_])";

std::string Word(std::string_view body) {
  return fmt::format("(?:^|{0})(?:{1})(?:{0}|$)", kNonWord, body);
}

std::string Exact(std::string_view body) {
  return fmt::format(R"(^\s*(?:{})\s*$)", body);
}

// Avoid a bare "summary": it over-matches ("summary of findings").
const std::vector<PhraseSet> &KeywordPhrases() {
  static const std::vector<PhraseSet> kPhrases{
      {SectionType::kFrontMatter,
       {
           Word(R"(table\s+of\s+contents)"),
           Exact("contents"),
           Word("sommaire"),
           Word(R"(table\s+des\s+mati[eè]res)"),
           Word("[ií]ndice"),
           Word(R"(lista\s+de\s+figuras)"),
           Word(R"(lista\s+de\s+tablas)"),
           Word(R"(lista\s+de\s+gr[aá]ficos)"),
           Word(R"(lista\s+de\s+mapas)"),
           Word(R"(lista\s+de\s+cuadros)"),
           Word(R"(list\s+of\s+figures)"),
           Word(R"(list\s+of\s+tables)"),
           Word(R"(liste\s+des\s+figures)"),
           Word(R"(liste\s+des\s+tableaux)"),
           Word("acknowledg(e)?ments"),
           Word("remerciements"),
           Word("agradecimientos"),
           Word("foreword"),
           Word(R"(avant[-\s]?propos)"),
           Word("preface"),
           Word("disclaimer"),
           Word(R"(descargo\s+de\s+responsabilidad)"),
           Word(R"(exenci[oó]n\s+de\s+responsabilidad)"),
           Word(R"(personal\s+clave)"),
           Word(R"(cr[eé]ditos?\s+fotogr[aá]ficos)"),
           Word("copyright"),
       }},
      {SectionType::kAcronyms,
       {
           Word("acronyms"),
           Word("abbreviations"),
           Word("glossary"),
           Word("glossaire"),
           Word("glosario"),
           Word("sigles"),
           Word("abr[eé]viations"),
       }},
      {SectionType::kExecutiveSummary,
       {
           // English
           Word(R"(executive\s+summary)"),
           Word(R"(evaluation\s+brief)"),
           Exact("summary"),
           // French
           Word(R"(r[eé]sum[eé]\s+ex[eé]cutif)"),
           Word(R"(note\s+d['’]?[eé]valuation)"),
           // Spanish
           Word(R"(resumen\s+ejecutivo)"),
           Word(R"(nota\s+de\s+evaluaci[oó]n)"),
           // Russian
           Word(R"(исполнительное\s+резюме)"),
           // Hindi
           Word(R"(कार्यकारी\s+सारांश)"),
           // Arabic
           Word(R"(ملخص\s+تنفيذي)"),
           // Portuguese
           Word(R"(resumo\s+executivo)"),
           Word(R"(nota\s+de\s+avalia[çc][aã]o)"),
           // German
           Word(R"(exekutive\s+zusammenfassung)"),
           // Italian
           Word(R"(riassunto\s+esecutivo)"),
       }},
      {SectionType::kRecommendations,
       {
           Word("recommendations?"),
           Word(R"(management\s+response)"),
           Word(R"(way\s+forward)"),
           Word(R"(next\s+steps)"),
           Word("considerations?"),
           Word(R"(action\s+plan)"),
           Word(R"(priority\s+actions?)"),
           Word("recommandations?"),
           Word("recomendaciones?"),
           Word("рекомендации"),
           Word("सिफारिशें"),
           Word("التوصيات"),
           Word("recomenda[çc][oõ]es"),
           Word("empfehlungen"),
           Word("raccomandazioni"),
       }},
      {SectionType::kConclusions,
       {
           Word("conclusions?"),
           Word("conclusiones?"),
           Word("выводы"),
           Word("заключение"),
           Word("निष्कर्ष"),
           Word("الاستنتاجات"),
           Word("الخلاصة"),
           Word("conclus[oõ]es"),
           Word("schlussfolgerungen"),
           Word("conclusioni"),
       }},
      {SectionType::kMethodology,
       {
           Word("methodology"),
           Word("methods?"),
           Word("approach"),
           Word(R"(data\s+collection)"),
           Word("limitations?"),
           Word(R"(evaluation\s+design)"),
           Word(R"(research\s+design)"),
           Word("m[eé]thodologie"),
           Word("m[eé]thodes"),
           Word("metodolog[ií]a"),
           Word("m[eé]todos"),
           Word("методология"),
           Word("методы"),
           Word("कार्यप्रणाली"),
           Word("विधि"),
           Word("منهجية"),
           Word("طرق"),
           Word("methodik"),
           Word("methoden"),
           Word("metodi"),
       }},
      {SectionType::kIntroduction,
       {
           // English
           Word("introduction"),
           Word("purpose"),
           Word("scope"),
           Word(R"(object\s+of\s+evaluation)"),
           Word(R"(objectives?\s+of\s+the\s+evaluation)"),
           Word(R"(evaluation\s+objectives?)"),
           Word(R"(evaluation\s+aims?)"),
           Word(R"(evaluation\s+questions?)"),
           Word(R"(evaluation\s+features)"),
           Word(R"(evaluation\s+strategy)"),
           // French
           Word(R"(objectifs?\s+de\s+l['’]?[eé]valuation)"),
           Word("port[ée]e"),
           Word(R"(objet\s+de\s+l['’]?[eé]valuation)"),
           // Spanish
           Word("introducci[oó]n"),
           Word(R"(objetivos?\s+de\s+la\s+evaluaci[oó]n)"),
           Word("alcance"),
           Word(R"(objeto\s+de\s+la\s+evaluaci[oó]n)"),
           // Russian
           Word("введение"),
           Word(R"(цели\s+оценки)"),
           Word("задачи"),
           Word(R"(объект\s+оценки)"),
           // Hindi
           Word("परिचय"),
           Word(R"(मूल्यांकन\s+के\s+उद्देश्य)"),
           Word("परिधि"),
           // Arabic
           Word("مقدمة"),
           Word(R"(أهداف\s+التقييم)"),
           Word("نطاق"),
           // Portuguese
           Word("introdu[çc][aã]o"),
           Word(R"(objetivos?\s+da\s+avalia[çc][aã]o)"),
           Word("escopo"),
           // German
           Word("einf[üu]hrung"),
           Word(R"(ziele\s+der\s+bewertung)"),
           Word("umfang"),
           // Italian
           Word("introduzione"),
           Word(R"(obiettivi\s+della\s+valutazione)"),
           Word("ambito"),
       }},
      {SectionType::kContext,
       {
           Word("overview"),
           Word("background"),
           Word("context"),
           Word(R"(project\s+description)"),
           Word(R"(theory\s+of\s+change)"),
           Word("intervention"),
           Word(R"(strategic\s+plan)"),
           Word("contexte"),
           Word(R"(vue\s+d['’]ensemble)"),
           Word(R"(description\s+du\s+projet)"),
           Word("contexto"),
           Word(R"(descripci[oó]n\s+del\s+proyecto)"),
           Word("обзор"),
           Word("контекст"),
           Word(R"(описание\s+проекта)"),
           Word("पृष्ठभूमि"),
           Word("प्रसंग"),
           Word("خلفية"),
           Word("سياق"),
           Word(R"(descri[çc][aã]o\s+do\s+projeto)"),
           Word("kontext"),
           Word("projektbeschreibung"),
           Word("contesto"),
           Word(R"(descrizione\s+del\s+progetto)"),
       }},
      {SectionType::kAppendix,
       {
           Word("appendix"),
           Word("appendices"),
           Word("appendice"),
           Word("ap[eéê]ndices?"),
           Word("приложение"),
           Word("приложения"),
           Word("परिशिष्ट"),
           Word("ملحق"),
           Word("ملاحق"),
           Word("anhang"),
           Word("anh[aä]nge"),
           Word("appendici"),
       }},
      {SectionType::kFindings,
       {
           Word("findings?"),
           Word("results?"),
           Word("observations?"),
           Word("analysis"),
           Word("hallazgos"),
           Word("r[eé]sultats?"),
           Word("constatations?"),
           Word("выводы"),
           Word("результаты"),
           Word("наблюдения"),
           Word("निष्कर्ष"),
           Word("परिणाम"),
           Word("النتائج"),
           Word("الاستنتاجات"),
           Word("resultados"),
           Word("observa[çc][oõ]es"),
           Word("ergebnisse"),
           Word("beobachtungen"),
           Word("risultati"),
           Word("osservazioni"),
           // Evaluation criteria are reported as findings.
           Word("relevance"),
           Word("effectiveness"),
           Word("efficiency"),
           Word("impact"),
           Word("sustainability"),
           Word("coherence"),
           Word("pertinence"),
           Word("efficacit[eé]"),
           Word("efficience"),
           Word("durabilit[eé]"),
           Word("coh[eé]rence"),
       }},
      {SectionType::kBibliography,
       {
           Word("bibliography"),
           Word(R"(works\s+cited)"),
           Word("references"),
           Word("bibliographie"),
           Word("r[eé]f[eé]rences"),
           Word("bibliograf[ií]a"),
           Word("referencias"),
           Word("библиография"),
           Word("ссылки"),
           Word("литература"),
           Word(R"(ग्रंथ\s+सूची)"),
           Word("संदर्भ"),
           Word("المراجع"),
           Word(R"(قائمة\s+المراجع)"),
           Word("refer[eê]ncias"),
           Word("referenzen"),
           Word("referenze"),
       }},
      {SectionType::kAnnexes,
       {
           // English
           Word("annex(es)?"),
           Word("annexure(s)?"),
           Word("appendix"),
           Word("appendices"),
           Word("attachments?"),
           // French
           Word("annexe(s)?"),
           Word("appendice(s)?"),
           Word(R"(termes\s+de\s+r[eé]f[eé]rence)"),
           Word("tdr"),
           // Spanish
           Word("anexo(s)?"),
           Word("ap[eé]ndice(s)?"),
           Word("adjuntos?"),
           // Russian
           Word("приложение"),
           Word("приложения"),
           // Hindi
           Word("अनुलग्नक"),
           // Arabic
           Word("ملحق"),
           Word("ملاحق"),
           // Portuguese
           Word("ap[eê]ndice(s)?"),
           Word(R"(termos\s+de\s+refer[eê]ncia)"),
           // German
           Word("anhang"),
           Word("anh[aä]nge"),
           // Italian
           Word("allegato(s)?"),
           // Chinese
           "附录",
           "附件",
           // Common terms and truncations
           Word(R"(terms\s+of\s+reference)"),
           Word("tor"),
           Word("anex"),
           Word("apend"),
       }},
  };
  return kPhrases;
}

const std::vector<std::string> &ExplicitAnnexPhrases() {
  static const std::vector<std::string> kPhrases{
      Word("annex(es)?"),
      Word("annexe(s)?"),
      Word("anexo(s)?"),
      Word("annexure(s)?"),
      Word("appendix"),
      Word("appendices"),
      Word("attachment(s)?"),
      Word(R"(terms\s+of\s+reference)"),
      Word(R"(termes\s+de\s+r[eé]f[eé]rence)"),
      Word(R"(t[eé]rminos\s+de\s+referencia)"),
      Word(R"(termos\s+de\s+refer[eê]ncia)"),
      Word("allegat[oi]"),
      Word("anhang"),
      Word("приложени[ея]"),
      Word("ملحق"),
      "附录",
      "附件",
  };
  return kPhrases;
}

} // namespace rules
