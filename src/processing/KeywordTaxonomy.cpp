#include "KeywordTaxonomy.hpp"
#include "TextUtils.hpp"

#include <algorithm>
#include <iterator>

namespace docstruct
{

namespace
{

// Functional areas of typical Korean service requirement documents
KeywordList builtInGroups()
{
    return {
        { "인증", { "로그인", "로그아웃", "회원가입", "탈퇴", "비밀번호", "인증", "권한", "세션", "토큰", "OAuth", "SSO" } },
        { "결제", { "결제", "구매", "주문", "카드", "환불", "정산", "포인트", "쿠폰", "할인", "가격" } },
        { "사용자관리", { "사용자", "회원", "프로필", "개인정보", "계정", "정보수정", "마이페이지" } },
        { "상품관리", { "상품", "제품", "카탈로그", "재고", "등록", "수정", "삭제", "조회" } },
        { "검색", { "검색", "필터", "정렬", "조회", "찾기" } },
        { "알림", { "알림", "푸시", "메시지", "이메일", "SMS", "통지" } },
        { "관리자", { "관리자", "admin", "대시보드", "통계", "모니터링" } },
        { "데이터관리", { "데이터베이스", "백업", "복원", "마이그레이션", "스키마" } },
        { "API", { "API", "엔드포인트", "REST", "GraphQL", "웹훅" } },
        { "보안", { "보안", "암호화", "XSS", "CSRF", "SQL Injection", "취약점" } },
    };
}

} // anonymous namespace

KeywordTaxonomy::KeywordTaxonomy(const KeywordList& groups)
{
    for (const auto& [name, keywords] : groups)
        append(name, keywords);
}

const KeywordTaxonomy& KeywordTaxonomy::defaults()
{
    static const KeywordTaxonomy instance(builtInGroups());
    return instance;
}

void KeywordTaxonomy::append(const std::string& name, const std::vector<std::string>& keywords)
{
    auto it = std::find_if(entries_.begin(), entries_.end(), [&name](const Entry& e) { return e.name == name; });
    if (it == entries_.end())
    {
        entries_.push_back(Entry{ name, {} });
        it = std::prev(entries_.end());
    }

    for (const auto& keyword : keywords)
    {
        std::string folded = caseFold(trim(keyword));
        if (folded.empty())
            continue;
        if (std::find(it->keywords.begin(), it->keywords.end(), folded) == it->keywords.end())
            it->keywords.push_back(std::move(folded));
    }
}

KeywordTaxonomy KeywordTaxonomy::merged(const KeywordList& custom) const
{
    KeywordTaxonomy copy = *this;
    for (const auto& [name, keywords] : custom)
        copy.append(name, keywords);
    return copy;
}

KeywordTaxonomy KeywordTaxonomy::withGroup(const std::string& name, const std::vector<std::string>& keywords) const
{
    KeywordTaxonomy copy = *this;
    copy.append(name, keywords);
    return copy;
}

KeywordTaxonomy KeywordTaxonomy::withoutGroup(const std::string& name) const
{
    KeywordTaxonomy copy = *this;
    copy.entries_.erase(std::remove_if(copy.entries_.begin(), copy.entries_.end(),
                                       [&name](const Entry& e) { return e.name == name; }),
                        copy.entries_.end());
    return copy;
}

std::vector<std::string> KeywordTaxonomy::groupNames() const
{
    std::vector<std::string> names;
    names.reserve(entries_.size());
    for (const auto& entry : entries_)
        names.push_back(entry.name);
    return names;
}

const std::vector<std::string>* KeywordTaxonomy::keywordsFor(const std::string& name) const
{
    for (const auto& entry : entries_)
    {
        if (entry.name == name)
            return &entry.keywords;
    }
    return nullptr;
}

} // namespace docstruct
