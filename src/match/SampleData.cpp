#include "match/SampleData.hpp"

namespace match {

static Internship sample(
    const char* id, const char* title, const char* company, const char* sector, const char* location,
    std::vector<std::string> skills, const char* education, int capacity, int months, int stipend,
    bool rural_friendly, bool diversity_focused
) {
    InternshipFields f;
    f.id = id;
    f.title = title;
    f.company = company;
    f.sector = sector;
    f.location = location;
    f.skills_required = std::move(skills);
    f.education_level = education;
    f.capacity = capacity;
    f.duration_months = months;
    f.stipend = stipend;
    f.rural_friendly = rural_friendly;
    f.diversity_focused = diversity_focused;
    return make_internship(f);
}

std::vector<Internship> sample_internships() {
    std::vector<Internship> out;
    out.push_back(sample("1", "Software Development Intern", "TechCorp India", "Technology", "Bangalore",
                         {"Python", "JavaScript", "React", "SQL"}, "Bachelor", 5, 6, 15000, true, true));
    out.push_back(sample("2", "Data Science Intern", "DataAnalytics Ltd", "Technology", "Mumbai",
                         {"Python", "Machine Learning", "Statistics", "Pandas"}, "Master", 3, 4, 20000, false, true));
    out.push_back(sample("3", "Marketing Intern", "BrandBuilders", "Marketing", "Delhi",
                         {"Digital Marketing", "Social Media", "Content Writing", "Analytics"}, "Bachelor", 4, 3, 12000, true, false));
    out.push_back(sample("4", "Finance Intern", "FinTech Solutions", "Finance", "Chennai",
                         {"Excel", "Financial Analysis", "Accounting", "PowerBI"}, "Bachelor", 2, 5, 18000, false, true));
    out.push_back(sample("5", "Healthcare Research Intern", "MedResearch Institute", "Healthcare", "Hyderabad",
                         {"Research", "Data Analysis", "Medical Knowledge", "Python"}, "Master", 3, 6, 16000, true, true));
    return out;
}

std::vector<Candidate> sample_candidates() {
    std::vector<Candidate> out;

    CandidateFields priya;
    priya.id = "c1";
    priya.name = "Priya Sharma";
    priya.education_level = "Bachelor";
    priya.skills = {"Python", "JavaScript", "React", "SQL"};
    priya.location = "Bangalore";
    priya.sector_interests = {"Technology", "Software Development"};
    priya.social_category = "General";
    out.push_back(make_candidate(priya));

    CandidateFields raj;
    raj.id = "c2";
    raj.name = "Raj Kumar";
    raj.education_level = "Master";
    raj.skills = {"Python", "Machine Learning", "Statistics", "Data Analysis"};
    raj.location = "Mumbai";
    raj.sector_interests = {"Technology", "Data Science"};
    raj.social_category = "OBC";
    raj.from_rural_area = true;
    raj.first_generation_graduate = true;
    out.push_back(make_candidate(raj));

    CandidateFields sunita;
    sunita.id = "c3";
    sunita.name = "Sunita Devi";
    sunita.education_level = "Bachelor";
    sunita.skills = {"Digital Marketing", "Social Media", "Content Writing"};
    sunita.location = "Delhi";
    sunita.sector_interests = {"Marketing", "Communication"};
    sunita.social_category = "SC";
    sunita.prefers_rural = true;
    sunita.from_rural_area = true;
    sunita.first_generation_graduate = true;
    out.push_back(make_candidate(sunita));

    return out;
}

}  // namespace match
